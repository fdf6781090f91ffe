/**
 * @file grid_builder.h
 * @brief Fusion pipeline: detector outputs to addressable grid cells.
 */

#ifndef CHORDGRID_CORE_GRID_BUILDER_H
#define CHORDGRID_CORE_GRID_BUILDER_H

#include <optional>
#include <vector>

#include "core/beat_grid.h"
#include "core/chord_normalizer.h"
#include "core/grid_types.h"

namespace chordgrid {

/**
 * @brief Alignment parameters for one build.
 *
 * Each explicit value overrides the matching detector hint; a hint overrides
 * automatic estimation.
 */
struct GridBuildOptions {
  std::optional<int> beats_per_measure;  ///< Override of the detected time signature
  std::optional<int> shift_count;        ///< Override of the detector shift hint
  std::optional<int> padding_count;      ///< Override of the detector padding hint
  int default_beats_per_measure = DEFAULT_BEATS_PER_MEASURE;
  bool auto_align = true;        ///< Estimate padding/shift when neither is given
  bool simplify_chords = false;  ///< Reduce chords to the five families
};

/// @brief Everything derived from one build.
struct GridBuildResult {
  BeatGrid grid;
  std::vector<GridCell> cells;              ///< One per frame, padding first
  std::vector<OccurrenceKey> occurrences;   ///< Parallel to cells
  std::vector<double> beat_times;           ///< Real beat times actually used
  std::vector<Diagnostic> diagnostics;

  bool operator==(const GridBuildResult& other) const {
    return grid == other.grid && cells == other.cells && occurrences == other.occurrences &&
           beat_times == other.beat_times;
  }
};

/**
 * @brief Runs the grid pipeline: beat sanitizing, chord mapping, alignment,
 * cell assembly and occurrence tracking.
 *
 * No state besides the normalizer cache: identical inputs produce identical
 * results.
 */
class GridBuilder {
 public:
  explicit GridBuilder(ChordNormalizer& normalizer) : normalizer_(normalizer) {}

  /**
   * @brief Build the fused grid.
   * @param beats Beat detector output
   * @param chords Chord detector output
   * @param options Alignment parameters
   * @return Grid, cells, keys and diagnostics
   */
  GridBuildResult build(const BeatDetection& beats, const ChordDetection& chords,
                        const GridBuildOptions& options = GridBuildOptions()) const;

 private:
  ChordNormalizer& normalizer_;
};

/// @brief Resolved time signature: override, then detector, then default.
int resolveBeatsPerMeasure(const BeatDetection& beats, const GridBuildOptions& options);

/**
 * @brief One {chord, beat_index, beat_num} entry per real beat.
 *
 * beat_index counts real beats only, so it indexes the stored beat array.
 * Empty cells export NO_CHORD_LABEL.
 */
std::vector<SynchronizedChord> synchronizedChords(const std::vector<GridCell>& cells);

/// @brief Visual-to-audio index mapping for every clickable cell.
std::vector<AudioMapping> audioMapping(const std::vector<GridCell>& cells);

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_GRID_BUILDER_H
