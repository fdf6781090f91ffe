/**
 * @file beat_alignment.h
 * @brief Automatic padding and shift estimation for measure alignment.
 *
 * Used when the beat detector does not supply shift/padding hints. Padding
 * fills the lead-in before the first detected beat; shift rotates the
 * beat-of-measure labels so chord changes fall on downbeats.
 */

#ifndef CHORDGRID_CORE_BEAT_ALIGNMENT_H
#define CHORDGRID_CORE_BEAT_ALIGNMENT_H

#include <optional>
#include <string>
#include <vector>

namespace chordgrid {

/// First-beat times at or below this need no padding.
constexpr double MIN_PADDING_LEAD_IN_SEC = 0.05;

/// Lead-in (as a fraction of one beat) that still earns one padding frame.
constexpr double MIN_PADDING_GAP_RATIO = 0.2;

/**
 * @brief Estimate tempo from beat spacing.
 * @param beats Strictly increasing beat times
 * @return 60 / median inter-beat interval, or DEFAULT_BPM with fewer than two beats
 */
double estimateBpm(const std::vector<double>& beats);

/**
 * @brief Padding frames needed to cover the lead-in before the first beat.
 *
 * floor(first_beat * bpm / 60), raised to one for a lead-in longer than
 * MIN_PADDING_GAP_RATIO of a beat. Whole measures are removed; an exact
 * multiple of the measure keeps beats_per_measure - 1 frames. Without a known
 * signature the result is capped at DEFAULT_BEATS_PER_MEASURE - 1.
 *
 * @param first_beat_sec Time of the first detected beat
 * @param bpm Tempo (non-finite products give 0)
 * @param beats_per_measure Time signature numerator (<= 0 means unknown)
 * @return Padding frame count, less than one measure
 */
int estimatePaddingCount(double first_beat_sec, double bpm, int beats_per_measure);

/**
 * @brief Pick the label rotation that puts the most chord changes on downbeats.
 *
 * A change counts when a non-empty chord differs from the chord seen on the
 * previous downbeat and starts on this beat. Ties prefer the smaller shift.
 *
 * @param chords One display label per real beat ("" for no chord)
 * @param beats_per_measure Time signature numerator
 * @param padding_count Padding frames preceding the first beat
 * @return Shift in [0, beats_per_measure), 0 for empty input or unknown signature
 */
int calculateOptimalShift(const std::vector<std::string>& chords, int beats_per_measure,
                          int padding_count);

/**
 * @brief Shift that places the first reported downbeat on position 1.
 * @param beats Beat times
 * @param downbeats Downbeat times
 * @param beats_per_measure Time signature numerator
 * @param padding_count Padding frames preceding the first beat
 * @return Shift, or nullopt when no downbeat matches a beat
 */
std::optional<int> shiftFromDownbeats(const std::vector<double>& beats,
                                      const std::vector<double>& downbeats,
                                      int beats_per_measure, int padding_count);

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_BEAT_ALIGNMENT_H
