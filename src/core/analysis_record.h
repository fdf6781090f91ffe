/**
 * @file analysis_record.h
 * @brief Persisted analysis: detector outputs, synchronized chords, corrections.
 *
 * Records carry an explicit schema_version. Older versions are converted by a
 * dedicated migration function; the reader never infers the version from the
 * shape of individual fields.
 */

#ifndef CHORDGRID_CORE_ANALYSIS_RECORD_H
#define CHORDGRID_CORE_ANALYSIS_RECORD_H

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/correction_layer.h"
#include "core/grid_types.h"
#include "core/json_helpers.h"

namespace chordgrid {

/// Schema written by AnalysisRecord::toJson().
constexpr int CURRENT_SCHEMA_VERSION = 2;

/**
 * @brief Cached analysis of one recording.
 *
 * Schema 2 layout:
 * ```json
 * {
 *   "schema_version": 2,
 *   "recording_id": "dQw4w9WgXcQ",
 *   "beat_model": "beat-transformer", "chord_model": "chord-cnn-lstm",
 *   "beats": [0.52, 1.04], "downbeats": [0.52],
 *   "time_signature": 4, "bpm": 115.4, "shift_count": 1, "padding_count": 3,
 *   "chords": [{"label": "C", "start": 0.5, "end": 2.1, "confidence": 0.9}],
 *   "synchronized_chords": [{"chord": "C", "beat_index": 0, "beat_num": 1}],
 *   "corrections": [{"chord": "C#", "occurrence": 0, "replacement": "Db"}],
 *   "global_corrections": {"D#": "Eb"},
 *   "original_chords": ["C#"], "corrected_chords": ["Db"],
 *   "key_signature": "Db major"
 * }
 * ```
 */
struct AnalysisRecord {
  int schema_version = CURRENT_SCHEMA_VERSION;
  std::string recording_id;
  BeatDetection beats;    ///< Model id in beats.model
  ChordDetection chords;  ///< Model id in chords.model
  std::vector<SynchronizedChord> synchronized_chords;
  CorrectionMap corrections;
  std::map<std::string, std::string> global_corrections;  ///< Apply to every run of a display
  std::vector<std::string> original_chords;   ///< Sequence-correction input
  std::vector<std::string> corrected_chords;  ///< Sequence-correction output
  std::optional<std::string> key_signature;

  /// @brief Store key for this record.
  std::string cacheKey() const;

  /// @brief beat_index of every synchronized chord, in stored order.
  std::vector<int> persistedIndices() const;

  /// @brief Serialize with the current schema.
  std::string toJson(bool pretty = true) const;

  /**
   * @brief Parse a record of any supported schema.
   * @param text JSON text
   * @param diagnostics Receives SchemaVersionUnsupported (may be null)
   * @return Record upgraded to the current schema, or nullopt for a newer schema
   */
  static std::optional<AnalysisRecord> fromJson(const std::string& text,
                                                std::vector<Diagnostic>* diagnostics = nullptr);
};

/**
 * @brief Store key: `<recording_id>_<beat_model>_<chord_model>`.
 */
std::string makeCacheKey(const std::string& recording_id, const std::string& beat_model,
                         const std::string& chord_model);

/// @brief Declared schema version; records without one are version 1.
int recordSchemaVersion(const json::Parser& p);

/**
 * @brief Read a version 1 record.
 *
 * Version 1 used camelCase keys, beats as `{time, beatNum}` objects, chords
 * as `{chord, start, end, confidence}` and corrections as a map from display
 * to either a replacement (all runs) or `{occurrence: replacement}` with
 * 1-based occurrences. It stored no padding hint.
 *
 * @param p Parsed version 1 record
 * @return Equivalent current record
 */
AnalysisRecord migrateV1(const json::Parser& p);

/// @brief Read a version 2 record.
AnalysisRecord parseV2(const json::Parser& p);

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_ANALYSIS_RECORD_H
