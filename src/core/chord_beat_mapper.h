/**
 * @file chord_beat_mapper.h
 * @brief Assigns detector chord segments to beat timestamps.
 */

#ifndef CHORDGRID_CORE_CHORD_BEAT_MAPPER_H
#define CHORDGRID_CORE_CHORD_BEAT_MAPPER_H

#include <optional>
#include <vector>

#include "core/beat_grid.h"
#include "core/chord_normalizer.h"
#include "core/grid_types.h"

namespace chordgrid {

/**
 * @brief Select the segment that labels a timestamp.
 *
 * Containing segments ([start, end)) win; among several the latest start
 * wins (later input position on equal starts). Without a containing segment
 * the latest segment with start <= time forward-fills.
 *
 * @param segments Detector segments in any order
 * @param time Beat time in seconds
 * @param containing_count Receives the number of segments containing time (may be null)
 * @return Index into segments, or nullopt if no segment has started
 */
std::optional<size_t> segmentAt(const std::vector<ChordSegment>& segments, double time,
                                int* containing_count = nullptr);

/**
 * @brief Maps chord segments onto beats, normalizing each label once.
 *
 * Invalid labels and explicit no-chord segments produce empty cells; a bad
 * label never aborts the mapping.
 */
class ChordBeatMapper {
 public:
  explicit ChordBeatMapper(ChordNormalizer& normalizer) : normalizer_(normalizer) {}

  /**
   * @brief Chord for each timestamp.
   * @param times Real beat times
   * @param segments Detector segments
   * @param diagnostics Receives InvalidChordLabel / AmbiguousSegmentOverlap (may be null)
   * @return One entry per time; nullopt = empty cell
   */
  std::vector<std::optional<NormalizedChord>> mapTimes(
      const std::vector<double>& times, const std::vector<ChordSegment>& segments,
      std::vector<Diagnostic>* diagnostics = nullptr);

  /**
   * @brief Build grid cells from a beat grid and per-beat chords.
   * @param grid Structural grid (padding frames first)
   * @param chords One entry per real beat, as returned by mapTimes()
   * @return One cell per frame; padding cells are always empty
   */
  static std::vector<GridCell> assembleCells(
      const BeatGrid& grid, const std::vector<std::optional<NormalizedChord>>& chords);

  /**
   * @brief mapTimes() followed by assembleCells().
   * @param grid Structural grid
   * @param segments Detector segments
   * @param diagnostics Receives mapping diagnostics (may be null)
   * @return Cells of the fused grid
   */
  std::vector<GridCell> map(const BeatGrid& grid, const std::vector<ChordSegment>& segments,
                            std::vector<Diagnostic>* diagnostics = nullptr);

 private:
  ChordNormalizer& normalizer_;
};

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_CHORD_BEAT_MAPPER_H
