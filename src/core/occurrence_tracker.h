/**
 * @file occurrence_tracker.h
 * @brief Run numbering of chord displays across a grid.
 */

#ifndef CHORDGRID_CORE_OCCURRENCE_TRACKER_H
#define CHORDGRID_CORE_OCCURRENCE_TRACKER_H

#include <map>
#include <string>
#include <vector>

#include "core/grid_types.h"

namespace chordgrid {

/**
 * @brief Assigns OccurrenceKeys to grid cells.
 *
 * A run is a maximal stretch of cells with the same display (empty cells
 * included). Each display value owns a counter that advances when a new run
 * of that value begins, so [C, C, G, C] yields C#0, C#0, G#0, C#1.
 * Keys are recomputed from scratch for every grid.
 */
class OccurrenceTracker {
 public:
  /**
   * @brief Compute one key per cell.
   * @param cells Grid cells in order
   * @return Keys, parallel to cells
   */
  static std::vector<OccurrenceKey> track(const std::vector<GridCell>& cells);

  /**
   * @brief Compute keys for a plain label sequence.
   * @param labels Display labels ("" for empty)
   * @return Keys, parallel to labels
   */
  static std::vector<OccurrenceKey> track(const std::vector<std::string>& labels);

  /**
   * @brief Number of runs per display value.
   * @param keys Keys from track()
   * @return display -> run count
   */
  static std::map<std::string, int> runCounts(const std::vector<OccurrenceKey>& keys);
};

/**
 * @brief Whether a cell should print its chord label.
 *
 * True at the first cell of each non-empty run. A no-chord label that follows
 * another no-chord run (with only empty cells between) is suppressed.
 *
 * @param index Cell index
 * @param labels Display labels ("" for empty, NO_CHORD_LABEL for silence)
 * @return True if the label is shown
 */
bool shouldShowChordLabel(size_t index, const std::vector<std::string>& labels);

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_OCCURRENCE_TRACKER_H
