/**
 * @file chordgrid.cpp
 * @brief ChordGrid session implementation.
 */

#include "chordgrid.h"

#include <algorithm>

#include "core/logging.h"
#include "core/occurrence_tracker.h"

namespace chordgrid {

ChordGrid::ChordGrid(const GridConfig& config)
    : config_(config), normalizer_(config.normalizer_cache_capacity) {
  overrides_.default_beats_per_measure = config_.beats_per_measure;
  overrides_.auto_align = config_.auto_align;
  overrides_.simplify_chords = config_.simplify_chords;
}

const GridBuildResult& ChordGrid::build(const BeatDetection& beats, const ChordDetection& chords) {
  beats_ = beats;
  chords_ = chords;
  overrides_.beats_per_measure.reset();
  overrides_.shift_count.reset();
  overrides_.padding_count.reset();
  return runBuild();
}

const GridBuildResult& ChordGrid::rebuild(std::optional<int> shift_count,
                                          std::optional<int> padding_count) {
  if (shift_count) overrides_.shift_count = shift_count;
  if (padding_count) overrides_.padding_count = padding_count;
  return runBuild();
}

const GridBuildResult& ChordGrid::setBeatsPerMeasure(int beats_per_measure) {
  overrides_.beats_per_measure = beats_per_measure;
  return runBuild();
}

const GridBuildResult& ChordGrid::setSimplifyChords(bool simplify) {
  config_.simplify_chords = simplify;
  overrides_.simplify_chords = simplify;
  return runBuild();
}

const GridBuildResult& ChordGrid::runBuild() {
  result_ = GridBuilder(normalizer_).build(beats_, chords_, overrides_);
  refreshCorrections();
  return result_;
}

std::string ChordGrid::keyDisplay(const std::string& label) const {
  NormalizeResult normalized = normalizeChordLabel(label);
  if (!normalized.chord) return label;
  if (config_.simplify_chords) return simplifyChord(*normalized.chord).display;
  return normalized.chord->display;
}

void ChordGrid::refreshCorrections() {
  active_corrections_.clear();

  const CorrectionMap base = config_.simplify_chords ? corrections_.simplified() : corrections_;
  for (const auto& [key, replacement] : base.entries()) {
    OccurrenceKey active_key{keyDisplay(key.display), key.occurrence};
    if (active_corrections_.find(active_key)) continue;
    active_corrections_.set(active_key, replacement);
  }

  std::map<std::string, int> runs = OccurrenceTracker::runCounts(result_.occurrences);
  for (const auto& [display, replacement] : global_corrections_) {
    std::string active_display = keyDisplay(display);
    auto it = runs.find(active_display);
    if (it == runs.end()) continue;
    std::string label = config_.simplify_chords ? simplifyLabel(replacement) : replacement;
    for (int run = 0; run < it->second; ++run) {
      OccurrenceKey key{active_display, run};
      if (!active_corrections_.find(key)) active_corrections_.set(key, label);
    }
  }
  refreshLabels();
}

void ChordGrid::refreshLabels() {
  target_key_ = key_signature_ ? transposeKey(*key_signature_, transpose_) : std::string();
  original_labels_.clear();
  corrected_labels_.clear();
  original_labels_.reserve(result_.cells.size());
  corrected_labels_.reserve(result_.cells.size());
  for (size_t i = 0; i < result_.cells.size(); ++i) {
    original_labels_.push_back(getDisplay(i, false).label);
    corrected_labels_.push_back(getDisplay(i, true).label);
  }
}

int ChordGrid::setTranspose(int semitones) {
  transpose_ = std::clamp(semitones, MIN_TRANSPOSE_SEMITONES, MAX_TRANSPOSE_SEMITONES);
  refreshLabels();
  CHORDGRID_LOG_DEBUG("Transpose " << transpose_ << " semitones"
                                   << (target_key_.empty() ? "" : " to " + target_key_));
  return transpose_;
}

void ChordGrid::setKeySignature(const std::optional<std::string>& key) {
  key_signature_ = key;
  refreshLabels();
}

DisplayChord ChordGrid::getDisplay(size_t index, bool show_corrected) const {
  if (index >= result_.cells.size()) {
    CHORDGRID_LOG_DEBUG("getDisplay: index " << index << " beyond " << result_.cells.size()
                                             << " cells");
    return {};
  }
  DisplayChord shown = resolveDisplay(result_.cells[index], result_.occurrences[index],
                                     active_corrections_, show_corrected);
  if (transpose_ != 0) shown.label = transposeLabel(shown.label, transpose_, target_key_);
  return shown;
}

bool ChordGrid::setCorrection(size_t index, const std::string& replacement) {
  if (index >= result_.cells.size() || !result_.cells[index].chord) return false;
  const OccurrenceKey& key = result_.occurrences[index];
  corrections_.set(key, replacement);
  CHORDGRID_LOG_DEBUG("Correction " << key.display << "#" << key.occurrence << " -> "
                                    << replacement);
  refreshCorrections();
  return true;
}

bool ChordGrid::clearCorrection(size_t index) {
  if (index >= result_.cells.size()) return false;
  bool removed = corrections_.remove(result_.occurrences[index]);
  refreshCorrections();
  return removed;
}

void ChordGrid::applySequenceCorrections(const std::vector<std::string>& original,
                                         const std::vector<std::string>& corrected) {
  original_sequence_ = original;
  corrected_sequence_ = corrected;

  CorrectionMap derived = CorrectionMap::fromSequences(original, corrected);
  for (const auto& [key, replacement] : derived.entries()) {
    if (!corrections_.find(key)) corrections_.set(key, replacement);
  }
  refreshCorrections();
}

void ChordGrid::setGlobalCorrection(const std::string& display, const std::string& replacement) {
  if (replacement.empty() || replacement == display) {
    global_corrections_.erase(display);
  } else {
    global_corrections_[display] = replacement;
  }
  refreshCorrections();
}

void ChordGrid::setCorrections(const CorrectionMap& corrections) {
  corrections_ = corrections;
  refreshCorrections();
}

void ChordGrid::clearCorrections() {
  corrections_.clear();
  global_corrections_.clear();
  refreshCorrections();
}

std::vector<OccurrenceKey> ChordGrid::orphanedCorrections() const {
  return active_corrections_.orphanedKeys(result_.occurrences);
}

bool ChordGrid::shouldShowLabel(size_t index, bool show_corrected) const {
  return shouldShowChordLabel(index, show_corrected ? corrected_labels_ : original_labels_);
}

std::vector<SynchronizedChord> ChordGrid::synchronizedChords() const {
  return ::chordgrid::synchronizedChords(result_.cells);
}

std::vector<AudioMapping> ChordGrid::audioMapping() const {
  return ::chordgrid::audioMapping(result_.cells);
}

GridValidationReport ChordGrid::validate(const std::vector<int>& persisted_indices) const {
  return GridValidator().validate(result_.cells, persisted_indices);
}

AnalysisRecord ChordGrid::toRecord() const {
  AnalysisRecord record;
  record.recording_id = recording_id_;
  record.beats = beats_;
  record.beats.shift_count = result_.grid.shift_count;
  record.beats.padding_count = result_.grid.padding_count;
  if (overrides_.beats_per_measure) record.beats.time_signature = overrides_.beats_per_measure;
  record.chords = chords_;
  record.synchronized_chords = synchronizedChords();
  record.corrections = corrections_;
  record.global_corrections = global_corrections_;
  record.original_chords = original_sequence_;
  record.corrected_chords = corrected_sequence_;
  record.key_signature = key_signature_;
  return record;
}

GridValidationReport ChordGrid::loadRecord(const AnalysisRecord& record) {
  recording_id_ = record.recording_id;
  corrections_ = record.corrections;
  global_corrections_ = record.global_corrections;
  key_signature_ = record.key_signature;
  original_sequence_.clear();
  corrected_sequence_.clear();

  build(record.beats, record.chords);
  if (!record.original_chords.empty()) {
    applySequenceCorrections(record.original_chords, record.corrected_chords);
  }

  GridValidationReport report = validate(record.persistedIndices());
  std::vector<OccurrenceKey> orphans = orphanedCorrections();
  if (!orphans.empty()) {
    auto log = CHORDGRID_LOG_STREAM("warn");
    log << orphans.size() << " correction(s) in '" << recording_id_
        << "' no longer match a chord run:";
    for (const auto& key : orphans) log << " " << key.display << "#" << key.occurrence;
  }
  CHORDGRID_LOG_INFO("Loaded '" << record.cacheKey() << "': " << result_.cells.size()
                                << " cells, " << corrections_.size() << " corrections, "
                                << (report.valid ? "consistent" : "stale"));
  return report;
}

const char* ChordGrid::version() {
  return "1.0.0";
}

}  // namespace chordgrid
