/**
 * @file correction_layer.h
 * @brief Read-time chord relabeling keyed by occurrence.
 */

#ifndef CHORDGRID_CORE_CORRECTION_LAYER_H
#define CHORDGRID_CORE_CORRECTION_LAYER_H

#include <map>
#include <string>
#include <vector>

#include "core/grid_types.h"

namespace chordgrid {

/**
 * @brief Replacement labels keyed by (original display, run index).
 *
 * Entries never touch grid cells; they are consulted by resolveDisplay().
 * Keys are best-effort across grid rebuilds: when run boundaries move, an
 * entry may address a different run or none at all (see orphanedKeys()).
 */
class CorrectionMap {
 public:
  CorrectionMap() = default;

  /**
   * @brief Add or replace a correction.
   *
   * A replacement equal to the original display removes the entry.
   * Corrections for the empty display are ignored.
   *
   * @param key Run to relabel
   * @param replacement Display label to show instead
   */
  void set(const OccurrenceKey& key, const std::string& replacement);

  /// @brief Remove a correction. Returns true if one existed.
  bool remove(const OccurrenceKey& key);

  /// @brief Replacement for key, or nullptr.
  const std::string* find(const OccurrenceKey& key) const;

  void clear() { entries_.clear(); }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const std::map<OccurrenceKey, std::string>& entries() const { return entries_; }

  /**
   * @brief Entries whose key does not occur in a grid.
   * @param grid_keys Keys of the current grid
   * @return Orphaned keys in map order
   */
  std::vector<OccurrenceKey> orphanedKeys(const std::vector<OccurrenceKey>& grid_keys) const;

  /**
   * @brief Copy with keys and replacements reduced to the five chord families.
   *
   * When several entries collapse onto one key the first (in key order) wins.
   */
  CorrectionMap simplified() const;

  /**
   * @brief Build corrections from an automatic sequence-correction pass.
   *
   * Both sequences are chord-event lists of equal length. Original labels
   * are normalized to find runs; at the start of every run a corrected label
   * that differs from the original becomes an entry for that run, spelled
   * as given.
   *
   * @param original Detected chord sequence
   * @param corrected Corrected chord sequence
   * @return Correction map (empty on length mismatch)
   */
  static CorrectionMap fromSequences(const std::vector<std::string>& original,
                                     const std::vector<std::string>& corrected);

  bool operator==(const CorrectionMap& other) const { return entries_ == other.entries_; }

 private:
  std::map<OccurrenceKey, std::string> entries_;
};

/**
 * @brief Resolve the label shown for a cell.
 *
 * Returns the correction for key when show_corrected is set and an entry
 * exists; otherwise the cell's own display (empty for the empty marker).
 *
 * @param cell Grid cell
 * @param key Occurrence key of the cell
 * @param corrections Session corrections
 * @param show_corrected Caller's display toggle
 * @return Label and whether it was corrected
 */
DisplayChord resolveDisplay(const GridCell& cell, const OccurrenceKey& key,
                            const CorrectionMap& corrections, bool show_corrected);

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_CORRECTION_LAYER_H
