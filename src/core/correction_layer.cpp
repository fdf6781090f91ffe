/**
 * @file correction_layer.cpp
 * @brief Implementation of CorrectionMap and display resolution.
 */

#include "core/correction_layer.h"

#include <set>

#include "core/chord_normalizer.h"
#include "core/logging.h"
#include "core/occurrence_tracker.h"

namespace chordgrid {

namespace {

// Display form of a sequence label: canonical chord, or "" for silence/invalid.
std::string sequenceDisplay(const std::string& label) {
  NormalizeResult result = normalizeChordLabel(label);
  return result.chord ? result.chord->display : std::string();
}

std::string trimLabel(const std::string& label) {
  size_t begin = label.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  size_t end = label.find_last_not_of(" \t\r\n");
  return label.substr(begin, end - begin + 1);
}

}  // namespace

void CorrectionMap::set(const OccurrenceKey& key, const std::string& replacement) {
  if (key.display.empty()) return;
  if (replacement == key.display) {
    entries_.erase(key);
    return;
  }
  entries_[key] = replacement;
}

bool CorrectionMap::remove(const OccurrenceKey& key) { return entries_.erase(key) > 0; }

const std::string* CorrectionMap::find(const OccurrenceKey& key) const {
  auto it = entries_.find(key);
  return it == entries_.end() ? nullptr : &it->second;
}

std::vector<OccurrenceKey> CorrectionMap::orphanedKeys(
    const std::vector<OccurrenceKey>& grid_keys) const {
  std::set<OccurrenceKey> present(grid_keys.begin(), grid_keys.end());
  std::vector<OccurrenceKey> orphans;
  for (const auto& [key, replacement] : entries_) {
    if (present.count(key) == 0) orphans.push_back(key);
  }
  return orphans;
}

CorrectionMap CorrectionMap::simplified() const {
  CorrectionMap result;
  for (const auto& [key, replacement] : entries_) {
    NormalizeResult normalized = normalizeChordLabel(key.display);
    OccurrenceKey simple_key{
        normalized.chord ? simplifyChord(*normalized.chord).display : key.display,
        key.occurrence};
    if (result.find(simple_key)) continue;
    result.set(simple_key, simplifyLabel(replacement));
  }
  return result;
}

CorrectionMap CorrectionMap::fromSequences(const std::vector<std::string>& original,
                                           const std::vector<std::string>& corrected) {
  CorrectionMap map;
  if (original.size() != corrected.size()) {
    CHORDGRID_LOG_WARN("Sequence corrections ignored: " << original.size() << " original vs "
                                                        << corrected.size() << " corrected labels");
    return map;
  }

  std::vector<std::string> displays;
  displays.reserve(original.size());
  for (const auto& label : original) displays.push_back(sequenceDisplay(label));

  std::vector<OccurrenceKey> keys = OccurrenceTracker::track(displays);
  for (size_t i = 0; i < keys.size(); ++i) {
    bool run_start = i == 0 || displays[i] != displays[i - 1];
    if (!run_start || displays[i].empty()) continue;

    // Replacements keep their spelling: "Db" corrects a detected "C#".
    std::string replacement(trimLabel(corrected[i]));
    if (isNoChordLabel(replacement) || replacement == displays[i]) continue;
    map.set(keys[i], replacement);
  }
  return map;
}

DisplayChord resolveDisplay(const GridCell& cell, const OccurrenceKey& key,
                            const CorrectionMap& corrections, bool show_corrected) {
  DisplayChord result{cell.display(), false};
  if (!show_corrected || !cell.chord) return result;

  if (const std::string* replacement = corrections.find(key)) {
    result.label = *replacement;
    result.was_corrected = true;
  }
  return result;
}

}  // namespace chordgrid
