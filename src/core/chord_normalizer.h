/**
 * @file chord_normalizer.h
 * @brief Canonical spelling of raw detector chord labels.
 *
 * Raw labels arrive in several dialects ("F#:min7", "Gbm7", "F♯m7/A").
 * Normalization strips the bass note, resolves the root to one spelling per
 * pitch class and maps quality aliases to a canonical suffix. Quality is never
 * collapsed: an unrecognized suffix is kept verbatim instead of falling back to
 * major.
 */

#ifndef CHORDGRID_CORE_CHORD_NORMALIZER_H
#define CHORDGRID_CORE_CHORD_NORMALIZER_H

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "core/grid_types.h"

namespace chordgrid {

/// @brief Canonical root spelling per pitch class (C=0).
constexpr const char* PITCH_CLASS_NAMES[] = {"C",  "C#", "D",  "Eb", "E",  "F",
                                             "F#", "G",  "Ab", "A",  "Bb", "B"};

/// @brief Sharp and flat spellings used for transposed roots (C=0).
constexpr const char* SHARP_PITCH_NAMES[] = {"C",  "C#", "D",  "D#", "E",  "F",
                                             "F#", "G",  "G#", "A",  "A#", "B"};
constexpr const char* FLAT_PITCH_NAMES[] = {"C",  "Db", "D",  "Eb", "E",  "F",
                                            "Gb", "G",  "Ab", "A",  "Bb", "B"};

/// Pitch shift range accepted by the transposition functions.
constexpr int MIN_TRANSPOSE_SEMITONES = -6;
constexpr int MAX_TRANSPOSE_SEMITONES = 6;

/// @brief Label printed for no-chord cells in persisted records.
constexpr const char* NO_CHORD_LABEL = "N.C.";

/// @brief Classification of a raw label after normalization.
enum class LabelStatus : uint8_t {
  Chord,    ///< Valid chord; chord is set
  NoChord,  ///< Explicit silence ("N", "N.C.", "X", empty)
  Invalid   ///< Unparseable root (InvalidChordLabel)
};

/// @brief Result of normalizing one raw label.
struct NormalizeResult {
  LabelStatus status = LabelStatus::NoChord;
  std::optional<NormalizedChord> chord;  ///< Set only when status == Chord
};

/**
 * @brief Check whether a label denotes silence.
 * @param label Raw label (surrounding whitespace ignored)
 * @return True for "", "N", "N.C.", "N/C", "NC", "X" (case-insensitive)
 */
bool isNoChordLabel(std::string_view label);

/**
 * @brief Parse a root spelling to its pitch class.
 *
 * Accepts a letter A-G in either case followed by up to two accidentals
 * ('#', 'b', "♯", "♭"). The whole string must be consumed.
 *
 * @param root Root spelling (e.g. "Ab", "g#", "C♯")
 * @return Pitch class 0-11, or nullopt if not a pitch name
 */
std::optional<int> parsePitchClass(std::string_view root);

/// @brief Canonical spelling for a pitch class (wraps modulo 12).
const char* pitchClassName(int pitch_class);

/// @brief Sharp or flat spelling for a pitch class (wraps modulo 12).
const char* spelledPitchName(int pitch_class, bool prefer_flats);

/**
 * @brief Whether a key is written with flats.
 *
 * The tonic (text before the first space) decides: F, Bb, Eb, Ab, Db, Gb, Cb
 * and any tonic spelled with 'b' or "♭" use flats.
 *
 * @param key Key signature ("Db major", "F#m", "Bb")
 */
bool usesFlatSpelling(std::string_view key);

/**
 * @brief Transpose a key signature, keeping its sharp/flat preference.
 *
 * "Db major" +2 -> "Eb major", "A minor" +1 -> "A# minor". Text after the tonic
 * is kept. A key whose tonic is not a pitch name is returned unchanged.
 *
 * @param key Key signature
 * @param semitones Shift, clamped to [MIN_TRANSPOSE_SEMITONES, MAX_TRANSPOSE_SEMITONES]
 */
std::string transposeKey(const std::string& key, int semitones);

/**
 * @brief Transpose a normalized chord for display.
 *
 * The suffix is kept. The new root is spelled from the flat table when
 * target_key uses flats and from the sharp table otherwise (also for an empty
 * key), so the result may not use the canonical PITCH_CLASS_NAMES spelling.
 *
 * @param chord Chord in the detected key
 * @param semitones Shift, clamped to [MIN_TRANSPOSE_SEMITONES, MAX_TRANSPOSE_SEMITONES]
 * @param target_key Key the result is spelled in (already transposed)
 * @return Transposed chord; the input when semitones is 0
 */
NormalizedChord transposeChord(const NormalizedChord& chord, int semitones,
                               const std::string& target_key);

/**
 * @brief Transpose a display label ("Dm7/F" +2 in "E major" -> "Em7/G").
 *
 * The text after the root is kept as written. A note-name bass moves with the
 * root; a scale-degree bass ("C/5") is kept. No-chord labels and labels
 * without a pitch-name root are returned unchanged.
 *
 * @param label Display or correction label
 * @param semitones Shift, clamped to [MIN_TRANSPOSE_SEMITONES, MAX_TRANSPOSE_SEMITONES]
 * @param target_key Key the result is spelled in (already transposed)
 */
std::string transposeLabel(const std::string& label, int semitones,
                           const std::string& target_key);

/**
 * @brief Map a raw quality suffix to its canonical form.
 *
 * "min7" / "-7" -> "m7", "maj" / "M" -> "", "hdim7" / "ø" -> "m7b5".
 * Unknown suffixes are returned unchanged.
 *
 * @param suffix Raw suffix following the root
 * @return Canonical suffix
 */
std::string canonicalSuffix(const std::string& suffix);

/// @brief True if canonicalSuffix() knows this suffix.
bool isKnownSuffix(const std::string& suffix);

/**
 * @brief Normalize a raw chord label.
 *
 * Pure function: the same label always yields the same result.
 *
 * @param raw Raw detector label
 * @return Normalized chord, no-chord marker, or Invalid status
 */
NormalizeResult normalizeChordLabel(const std::string& raw);

/**
 * @brief Reduce a suffix to one of five families.
 * @param suffix Canonical suffix
 * @return "" (major), "m", "aug", "dim" or "sus"
 */
std::string simplifySuffix(const std::string& suffix);

/// @brief Apply simplifySuffix() to a normalized chord.
NormalizedChord simplifyChord(const NormalizedChord& chord);

/**
 * @brief Simplify a display label ("Dm7/F" -> "Dm", "N.C." unchanged).
 *
 * The root keeps its spelling; the bass note is dropped. Labels that do not
 * normalize to a chord are returned as given.
 */
std::string simplifyLabel(const std::string& label);

/**
 * @brief Memoizing normalizer with a bounded LRU cache.
 *
 * One instance belongs to one session. Results are identical to
 * normalizeChordLabel(); the cache only avoids repeated parsing.
 */
class ChordNormalizer {
 public:
  /// Default number of distinct labels kept.
  static constexpr size_t DEFAULT_CAPACITY = 256;

  explicit ChordNormalizer(size_t capacity = DEFAULT_CAPACITY);

  /**
   * @brief Normalize with memoization.
   * @param raw Raw detector label
   * @return Same value as normalizeChordLabel(raw)
   */
  NormalizeResult normalize(const std::string& raw);

  /// @brief Drop all cached entries and reset counters.
  void clear();

  size_t size() const { return entries_.size(); }
  size_t capacity() const { return capacity_; }
  size_t hits() const { return hits_; }
  size_t misses() const { return misses_; }

 private:
  using Entry = std::pair<std::string, NormalizeResult>;

  size_t capacity_;
  std::list<Entry> entries_;  // Most recently used first
  std::unordered_map<std::string, std::list<Entry>::iterator> index_;
  size_t hits_ = 0;
  size_t misses_ = 0;
};

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_CHORD_NORMALIZER_H
