/**
 * @file beat_grid.h
 * @brief Structural beat grid: measure positions, padding and shift.
 */

#ifndef CHORDGRID_CORE_BEAT_GRID_H
#define CHORDGRID_CORE_BEAT_GRID_H

#include <optional>
#include <vector>

#include "core/grid_types.h"

namespace chordgrid {

/// @brief Parameters controlling measure alignment of a beat grid.
struct BeatGridOptions {
  int beats_per_measure = DEFAULT_BEATS_PER_MEASURE;  ///< <= 0 means unknown signature
  int shift_count = 0;    ///< Rotation of beat-of-measure labels
  int padding_count = 0;  ///< Synthetic frames prepended before the first beat
};

/// @brief Frames of the structural grid plus the alignment actually applied.
struct BeatGrid {
  std::vector<BeatFrame> frames;  ///< Padding frames first, then one per real beat
  int beats_per_measure = DEFAULT_BEATS_PER_MEASURE;
  int shift_count = 0;
  int padding_count = 0;

  /// Number of frames backed by a detected beat.
  size_t realBeatCount() const { return frames.size() - static_cast<size_t>(padding_count); }

  bool operator==(const BeatGrid& other) const {
    return frames == other.frames && beats_per_measure == other.beats_per_measure &&
           shift_count == other.shift_count && padding_count == other.padding_count;
  }
};

/**
 * @brief Beat-of-measure label for a frame index.
 *
 * ((index + shift) mod beats_per_measure) + 1, or 1 for an unknown signature.
 *
 * @param index Frame index in the full array (padding included)
 * @param beats_per_measure Time signature numerator
 * @param shift_count Label rotation
 * @return Position in measure, 1-based
 */
int positionInMeasure(size_t index, int beats_per_measure, int shift_count);

/**
 * @brief Bound a padding request to less than one measure.
 *
 * Whole measures are removed, which leaves the measure position of every real
 * beat unchanged. Without a known signature the padding is capped at
 * DEFAULT_BEATS_PER_MEASURE - 1 frames. Negative requests become 0.
 *
 * @param padding_count Requested padding (option, hint or estimate)
 * @param beats_per_measure Time signature numerator (<= 0 means unknown)
 * @param diagnostics Receives PaddingOutOfRange when a request is reduced (may be null)
 * @return Padding in [0, beats_per_measure - 1]
 */
int clampPaddingCount(int padding_count, int beats_per_measure,
                      std::vector<Diagnostic>* diagnostics = nullptr);

/**
 * @brief Builds BeatGrid structures from detector timestamps.
 *
 * Timestamps are never reordered. Values that are negative, non-finite or not
 * strictly greater than the previous kept value are dropped and reported as
 * NonMonotonicBeat. Padding is bounded with clampPaddingCount().
 */
class BeatGridBuilder {
 public:
  explicit BeatGridBuilder(const BeatGridOptions& options = BeatGridOptions())
      : options_(options) {}

  /**
   * @brief Build the grid.
   * @param timestamps Beat times in seconds
   * @param downbeats Optional downbeat times; when empty, position 1 marks downbeats
   * @param diagnostics Receives dropped-beat, padding and empty-input reports (may be null)
   * @return The grid; empty frames when no usable beat exists
   */
  BeatGrid build(const std::vector<double>& timestamps, const std::vector<double>& downbeats,
                 std::vector<Diagnostic>* diagnostics = nullptr) const;

  const BeatGridOptions& options() const { return options_; }

 private:
  BeatGridOptions options_;
};

/**
 * @brief Drop timestamps that break the strictly-increasing contract.
 * @param timestamps Raw detector times
 * @param diagnostics Receives one NonMonotonicBeat per dropped value (may be null)
 * @return Sanitized, strictly increasing, non-negative times
 */
std::vector<double> sanitizeBeatTimes(const std::vector<double>& timestamps,
                                      std::vector<Diagnostic>* diagnostics = nullptr);

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_BEAT_GRID_H
