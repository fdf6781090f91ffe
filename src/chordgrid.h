/**
 * @file chordgrid.h
 * @brief High-level session API: build, correct, validate and persist a grid.
 */

#ifndef CHORDGRID_H
#define CHORDGRID_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/analysis_record.h"
#include "core/chord_normalizer.h"
#include "core/correction_layer.h"
#include "core/grid_builder.h"
#include "core/grid_config.h"
#include "core/grid_types.h"
#include "core/grid_validator.h"

namespace chordgrid {

/**
 * @brief One recording's timeline: detector inputs, the fused grid and the
 * user's corrections.
 *
 * Not thread-safe. Corrections may be edited at any time; every build
 * recomputes occurrence keys before corrections are consulted again.
 */
class ChordGrid {
 public:
  explicit ChordGrid(const GridConfig& config = GridConfig());

  /**
   * @brief Build the grid from fresh detector output.
   *
   * Clears explicit shift/padding overrides; corrections are kept.
   *
   * @param beats Beat detector output
   * @param chords Chord detector output
   * @return Build result
   */
  const GridBuildResult& build(const BeatDetection& beats, const ChordDetection& chords);

  /**
   * @brief Rebuild from the stored detector output with new alignment.
   *
   * nullopt leaves the corresponding override unchanged.
   *
   * @param shift_count Shift override
   * @param padding_count Padding override
   * @return Build result
   */
  const GridBuildResult& rebuild(std::optional<int> shift_count,
                                 std::optional<int> padding_count = std::nullopt);

  /// @brief Override the time signature and rebuild (<= 0 = unknown).
  const GridBuildResult& setBeatsPerMeasure(int beats_per_measure);

  /// @brief Toggle chord simplification and rebuild.
  const GridBuildResult& setSimplifyChords(bool simplify);

  /**
   * @brief Pitch-shift the displayed labels.
   *
   * Only getDisplay() and shouldShowLabel() change; cells, occurrence keys,
   * corrections and exports stay in the detected key.
   *
   * @param semitones Clamped to [MIN_TRANSPOSE_SEMITONES, MAX_TRANSPOSE_SEMITONES]
   * @return The applied shift
   */
  int setTranspose(int semitones);
  int transpose() const { return transpose_; }

  /// @brief Key signature of the recording, used to spell transposed roots.
  void setKeySignature(const std::optional<std::string>& key);
  const std::optional<std::string>& keySignature() const { return key_signature_; }

  /// @brief Key the transposed labels are spelled in (empty when unknown).
  const std::string& targetKey() const { return target_key_; }

  /// @name Grid Access
  /// @{

  const GridBuildResult& result() const { return result_; }
  const std::vector<GridCell>& cells() const { return result_.cells; }
  const std::vector<OccurrenceKey>& occurrences() const { return result_.occurrences; }
  const std::vector<Diagnostic>& diagnostics() const { return result_.diagnostics; }
  size_t size() const { return result_.cells.size(); }

  /// @}

  /// @name Corrections
  /// @{

  /**
   * @brief Label shown for a cell.
   * @param index Cell index
   * @param show_corrected Apply corrections
   * @return Resolved (and transposed) label; empty for padding, empty cells and bad indices
   */
  DisplayChord getDisplay(size_t index, bool show_corrected) const;

  /// @brief getDisplay() with the configured show_corrected default.
  DisplayChord getDisplay(size_t index) const {
    return getDisplay(index, config_.show_corrected);
  }

  /**
   * @brief Relabel the run containing a cell.
   * @param index Cell index
   * @param replacement Label to show for the whole run
   * @return False if the cell is out of range or has no chord
   */
  bool setCorrection(size_t index, const std::string& replacement);

  /// @brief Remove the correction of the run containing a cell.
  bool clearCorrection(size_t index);

  /**
   * @brief Merge corrections derived from a sequence-correction pass.
   *
   * Existing entries win over derived ones.
   *
   * @param original Detected chord sequence
   * @param corrected Corrected chord sequence
   */
  void applySequenceCorrections(const std::vector<std::string>& original,
                                const std::vector<std::string>& corrected);

  /// @brief Apply a replacement to every run of a display.
  void setGlobalCorrection(const std::string& display, const std::string& replacement);

  const CorrectionMap& corrections() const { return corrections_; }
  void setCorrections(const CorrectionMap& corrections);
  void clearCorrections();

  /// @brief Corrections whose key no longer occurs in the grid.
  std::vector<OccurrenceKey> orphanedCorrections() const;

  /// @brief True at the first cell of each displayed run.
  bool shouldShowLabel(size_t index, bool show_corrected) const;

  /// @}

  /// @name Export and Validation
  /// @{

  std::vector<SynchronizedChord> synchronizedChords() const;
  std::vector<AudioMapping> audioMapping() const;

  /// @brief Check persisted beat indices against the current grid.
  GridValidationReport validate(const std::vector<int>& persisted_indices) const;

  /**
   * @brief Snapshot for the analysis store.
   *
   * The applied shift/padding are stored as hints so that loading the
   * record reproduces this grid.
   */
  AnalysisRecord toRecord() const;

  /**
   * @brief Restore a stored analysis.
   *
   * Builds the grid from the record, attaches its corrections and checks its
   * synchronized chords against the rebuilt grid.
   *
   * @param record Stored analysis (any supported schema, already migrated)
   * @return Consistency report; invalid means the record is stale
   */
  GridValidationReport loadRecord(const AnalysisRecord& record);

  /// @}

  const GridConfig& config() const { return config_; }
  const std::string& recordingId() const { return recording_id_; }
  void setRecordingId(const std::string& id) { recording_id_ = id; }
  ChordNormalizer& normalizer() { return normalizer_; }

  /// @brief Library version string.
  static const char* version();

 private:
  const GridBuildResult& runBuild();
  void refreshCorrections();
  void refreshLabels();
  std::string keyDisplay(const std::string& label) const;

  GridConfig config_;
  ChordNormalizer normalizer_;
  GridBuildOptions overrides_;

  std::string recording_id_;
  BeatDetection beats_;
  ChordDetection chords_;
  GridBuildResult result_;

  CorrectionMap corrections_;
  std::map<std::string, std::string> global_corrections_;
  CorrectionMap active_corrections_;  // Keyed by the displays the grid shows

  std::vector<std::string> original_sequence_;
  std::vector<std::string> corrected_sequence_;
  std::optional<std::string> key_signature_;
  int transpose_ = 0;
  std::string target_key_;

  // Resolved labels for shouldShowLabel(), rebuilt with the grid and corrections.
  std::vector<std::string> original_labels_;
  std::vector<std::string> corrected_labels_;
};

}  // namespace chordgrid

#endif  // CHORDGRID_H
