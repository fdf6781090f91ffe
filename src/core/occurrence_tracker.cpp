/**
 * @file occurrence_tracker.cpp
 * @brief Implementation of OccurrenceTracker.
 */

#include "core/occurrence_tracker.h"

#include <unordered_map>

#include "core/chord_normalizer.h"

namespace chordgrid {

std::vector<OccurrenceKey> OccurrenceTracker::track(const std::vector<GridCell>& cells) {
  std::vector<std::string> labels;
  labels.reserve(cells.size());
  for (const auto& cell : cells) labels.push_back(cell.display());
  return track(labels);
}

std::vector<OccurrenceKey> OccurrenceTracker::track(const std::vector<std::string>& labels) {
  std::vector<OccurrenceKey> keys;
  keys.reserve(labels.size());

  std::unordered_map<std::string, int> next_run;
  const std::string* last = nullptr;
  int current_run = 0;

  for (const auto& label : labels) {
    if (!last || label != *last) {
      int& counter = next_run[label];
      current_run = counter++;
      last = &label;
    }
    keys.push_back({label, current_run});
  }
  return keys;
}

std::map<std::string, int> OccurrenceTracker::runCounts(const std::vector<OccurrenceKey>& keys) {
  std::map<std::string, int> counts;
  for (const auto& key : keys) {
    int& count = counts[key.display];
    if (key.occurrence + 1 > count) count = key.occurrence + 1;
  }
  return counts;
}

bool shouldShowChordLabel(size_t index, const std::vector<std::string>& labels) {
  if (index >= labels.size()) return false;
  const std::string& current = labels[index];
  if (current.empty()) return false;
  if (index == 0) return true;

  if (isNoChordLabel(current)) {
    for (size_t i = index; i-- > 0;) {
      if (!labels[i].empty()) return !isNoChordLabel(labels[i]);
    }
    return true;
  }
  return current != labels[index - 1];
}

}  // namespace chordgrid
