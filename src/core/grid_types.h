/**
 * @file grid_types.h
 * @brief Core data types for beat/chord grid fusion.
 */

#ifndef CHORDGRID_CORE_GRID_TYPES_H
#define CHORDGRID_CORE_GRID_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chordgrid {

/// Default time signature numerator (4/4).
constexpr int DEFAULT_BEATS_PER_MEASURE = 4;

/// Tempo assumed when neither the detector nor the beat spacing provides one.
constexpr double DEFAULT_BPM = 120.0;

// ============================================================================
// Detector Inputs
// ============================================================================

/// @brief Output of the external beat detector for one recording.
struct BeatDetection {
  std::vector<double> beats;          ///< Beat timestamps in seconds (strictly increasing)
  std::vector<double> downbeats;      ///< Optional downbeat timestamps
  std::optional<int> time_signature;  ///< Beats per measure, if reported
  std::optional<double> bpm;          ///< Tempo estimate, if reported
  std::optional<int> shift_count;     ///< Precomputed shift hint
  std::optional<int> padding_count;   ///< Precomputed padding hint
  std::string model;                  ///< Opaque model identifier
};

/// @brief One chord span reported by the external chord detector.
struct ChordSegment {
  std::string label;        ///< Raw detector spelling (e.g. "F#:min7", "Ab/C")
  double start = 0.0;       ///< Segment start in seconds
  double end = 0.0;         ///< Segment end in seconds (exclusive)
  float confidence = 1.0f;  ///< Detector confidence 0.0-1.0
};

/// @brief Output of the external chord detector for one recording.
struct ChordDetection {
  std::vector<ChordSegment> segments;
  std::string model;  ///< Opaque model identifier
};

// ============================================================================
// Grid Structures
// ============================================================================

/**
 * @brief Canonical chord spelling derived from a raw label.
 *
 * Root uses one spelling per pitch class; suffix keeps the detected quality.
 */
struct NormalizedChord {
  std::string root;         ///< Canonical root spelling (e.g. "Ab", "F#")
  uint8_t pitch_class = 0;  ///< Root pitch class 0-11 (C=0)
  std::string suffix;       ///< Canonical quality suffix ("" = major, "m", "m7", ...)
  std::string display;      ///< root + suffix

  bool operator==(const NormalizedChord& other) const {
    return pitch_class == other.pitch_class && suffix == other.suffix &&
           display == other.display && root == other.root;
  }
  bool operator!=(const NormalizedChord& other) const { return !(*this == other); }
};

/// @brief One beat of the structural grid.
struct BeatFrame {
  std::optional<double> timestamp;  ///< Absent for synthetic padding frames
  int position_in_measure = 1;      ///< 1-indexed beat of measure
  bool is_downbeat = false;
  bool is_padding = false;

  bool operator==(const BeatFrame& other) const {
    return timestamp == other.timestamp && position_in_measure == other.position_in_measure &&
           is_downbeat == other.is_downbeat && is_padding == other.is_padding;
  }
};

/// @brief True if the frame carries a real timestamp the player can seek to.
inline bool isClickable(const BeatFrame& frame) { return frame.timestamp.has_value(); }

/// @brief One addressable cell of the fused timeline.
struct GridCell {
  size_t beat_index = 0;                 ///< Index in the full array (padding included)
  std::optional<double> timestamp;       ///< Absent for padding cells
  std::optional<NormalizedChord> chord;  ///< Absent = empty marker (no chord)
  int beat_number = 1;                   ///< Position in measure
  bool is_downbeat = false;
  bool is_padding = false;

  /// Chord display string, empty for the empty marker.
  const std::string& display() const {
    static const std::string kEmpty;
    return chord ? chord->display : kEmpty;
  }

  bool operator==(const GridCell& other) const {
    return beat_index == other.beat_index && timestamp == other.timestamp &&
           chord == other.chord && beat_number == other.beat_number &&
           is_downbeat == other.is_downbeat && is_padding == other.is_padding;
  }
};

/// @brief True if the cell maps to a seekable audio position.
inline bool isClickable(const GridCell& cell) { return cell.timestamp.has_value(); }

/**
 * @brief Address of a chord run within the grid.
 *
 * occurrence counts runs of the same display value (0-based). Empty cells
 * carry an empty display and their own run counter.
 */
struct OccurrenceKey {
  std::string display;
  int occurrence = 0;

  bool operator==(const OccurrenceKey& other) const {
    return occurrence == other.occurrence && display == other.display;
  }
  bool operator!=(const OccurrenceKey& other) const { return !(*this == other); }
  bool operator<(const OccurrenceKey& other) const {
    if (display != other.display) return display < other.display;
    return occurrence < other.occurrence;
  }
};

/// @brief Label resolved for display.
struct DisplayChord {
  std::string label;
  bool was_corrected = false;
};

/// @brief Chord-to-beat association as stored by the analysis cache.
struct SynchronizedChord {
  std::string chord;   ///< Display label ("N.C." for silence)
  int beat_index = 0;  ///< Index into the raw (unpadded) beat array
  int beat_num = 1;    ///< Position in measure

  bool operator==(const SynchronizedChord& other) const {
    return chord == other.chord && beat_index == other.beat_index && beat_num == other.beat_num;
  }
};

/// @brief Links a visual grid cell back to its audio beat.
struct AudioMapping {
  std::string chord;
  double timestamp = 0.0;
  size_t visual_index = 0;  ///< Cell index in the padded grid
  size_t audio_index = 0;   ///< Index in the raw beat array
};

// ============================================================================
// Diagnostics
// ============================================================================

/// @brief Recoverable conditions reported alongside degraded results.
enum class GridError : uint8_t {
  InvalidChordLabel,         ///< Root is not one of the twelve pitch classes
  BeatArrayEmpty,            ///< No beats supplied; the grid is empty
  IndexOutOfRange,           ///< Persisted beat index beyond the loaded beat array
  AmbiguousSegmentOverlap,   ///< Several segments contain one beat timestamp
  NonMonotonicBeat,          ///< Beat timestamp dropped (negative, NaN, not increasing)
  SchemaVersionUnsupported,  ///< Persisted record is newer than this library
  PaddingOutOfRange          ///< Padding hint reduced to less than one measure
};

/// @brief Human-readable name of a GridError.
const char* gridErrorName(GridError error);

/// @brief One diagnostic produced while building or validating a grid.
struct Diagnostic {
  GridError code = GridError::InvalidChordLabel;
  std::string message;
  int beat_index = -1;  ///< Related beat index (-1 if not beat-specific)
};

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_GRID_TYPES_H
