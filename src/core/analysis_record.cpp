/**
 * @file analysis_record.cpp
 * @brief AnalysisRecord serialization and schema migration.
 */

#include "core/analysis_record.h"

#include <sstream>
#include <stdexcept>

#include "core/logging.h"

namespace chordgrid {

namespace {

void writeNumberArray(json::Writer& w, const char* key, const std::vector<double>& values) {
  w.beginArray(key);
  for (double v : values) w.value(v);
  w.endArray();
}

void writeStringArray(json::Writer& w, const char* key, const std::vector<std::string>& values) {
  w.beginArray(key);
  for (const auto& v : values) w.value(v);
  w.endArray();
}

template <typename T>
void writeOptional(json::Writer& w, const char* key, const std::optional<T>& value) {
  if (value) {
    w.write(key, *value);
  } else {
    w.writeNull(key);
  }
}

std::optional<int> readOptionalInt(const json::Parser& p, const std::string& key) {
  if (!p.has(key) || p.isNull(key)) return std::nullopt;
  return p.getInt(key);
}

std::optional<double> readOptionalDouble(const json::Parser& p, const std::string& key) {
  if (!p.has(key) || p.isNull(key)) return std::nullopt;
  return p.getDouble(key);
}

std::optional<std::string> readOptionalString(const json::Parser& p, const std::string& key) {
  if (!p.isString(key)) return std::nullopt;
  return p.getString(key);
}

}  // namespace

std::string makeCacheKey(const std::string& recording_id, const std::string& beat_model,
                         const std::string& chord_model) {
  return recording_id + "_" + beat_model + "_" + chord_model;
}

std::string AnalysisRecord::cacheKey() const {
  return makeCacheKey(recording_id, beats.model, chords.model);
}

std::vector<int> AnalysisRecord::persistedIndices() const {
  std::vector<int> indices;
  indices.reserve(synchronized_chords.size());
  for (const auto& entry : synchronized_chords) indices.push_back(entry.beat_index);
  return indices;
}

std::string AnalysisRecord::toJson(bool pretty) const {
  std::ostringstream oss;
  json::Writer w(oss, pretty);
  w.beginObject()
      .write("schema_version", CURRENT_SCHEMA_VERSION)
      .write("recording_id", recording_id)
      .write("beat_model", beats.model)
      .write("chord_model", chords.model);

  writeNumberArray(w, "beats", beats.beats);
  writeNumberArray(w, "downbeats", beats.downbeats);
  writeOptional(w, "time_signature", beats.time_signature);
  writeOptional(w, "bpm", beats.bpm);
  writeOptional(w, "shift_count", beats.shift_count);
  writeOptional(w, "padding_count", beats.padding_count);

  w.beginArray("chords");
  for (const auto& seg : chords.segments) {
    w.beginObject()
        .write("label", seg.label)
        .write("start", seg.start)
        .write("end", seg.end)
        .write("confidence", seg.confidence)
        .endObject();
  }
  w.endArray();

  w.beginArray("synchronized_chords");
  for (const auto& entry : synchronized_chords) {
    w.beginObject()
        .write("chord", entry.chord)
        .write("beat_index", entry.beat_index)
        .write("beat_num", entry.beat_num)
        .endObject();
  }
  w.endArray();

  w.beginArray("corrections");
  for (const auto& [key, replacement] : corrections.entries()) {
    w.beginObject()
        .write("chord", key.display)
        .write("occurrence", key.occurrence)
        .write("replacement", replacement)
        .endObject();
  }
  w.endArray();

  w.beginObject("global_corrections");
  for (const auto& [display, replacement] : global_corrections) {
    w.write(display.c_str(), replacement);
  }
  w.endObject();

  writeStringArray(w, "original_chords", original_chords);
  writeStringArray(w, "corrected_chords", corrected_chords);
  writeOptional(w, "key_signature", key_signature);
  w.endObject();
  return oss.str();
}

int recordSchemaVersion(const json::Parser& p) {
  if (!p.has("schema_version")) return 1;
  return p.getInt("schema_version", 0);
}

AnalysisRecord parseV2(const json::Parser& p) {
  AnalysisRecord record;
  record.recording_id = p.getString("recording_id");
  record.beats.model = p.getString("beat_model");
  record.chords.model = p.getString("chord_model");

  record.beats.beats = p.getDoubleArray("beats");
  record.beats.downbeats = p.getDoubleArray("downbeats");
  record.beats.time_signature = readOptionalInt(p, "time_signature");
  record.beats.bpm = readOptionalDouble(p, "bpm");
  record.beats.shift_count = readOptionalInt(p, "shift_count");
  record.beats.padding_count = readOptionalInt(p, "padding_count");

  for (const auto& c : p.getArray("chords")) {
    ChordSegment seg;
    seg.label = c.getString("label");
    seg.start = c.getDouble("start");
    seg.end = c.getDouble("end");
    seg.confidence = c.getFloat("confidence", 1.0f);
    record.chords.segments.push_back(seg);
  }

  for (const auto& s : p.getArray("synchronized_chords")) {
    record.synchronized_chords.push_back(
        {s.getString("chord"), s.getInt("beat_index"), s.getInt("beat_num", 1)});
  }

  for (const auto& c : p.getArray("corrections")) {
    record.corrections.set({c.getString("chord"), c.getInt("occurrence")},
                           c.getString("replacement"));
  }

  json::Parser global = p.getObject("global_corrections");
  for (const auto& display : global.keys()) {
    if (global.isString(display)) record.global_corrections[display] = global.getString(display);
  }

  record.original_chords = p.getStringArray("original_chords");
  record.corrected_chords = p.getStringArray("corrected_chords");
  record.key_signature = readOptionalString(p, "key_signature");
  return record;
}

AnalysisRecord migrateV1(const json::Parser& p) {
  AnalysisRecord record;
  record.recording_id = p.getString("videoId");
  record.beats.model = p.getString("beatModel");
  record.chords.model = p.getString("chordModel");

  // v1 beats are {time, beatNum} objects or plain numbers; null times are skipped.
  std::vector<json::Parser> beat_objects = p.getArray("beats");
  if (!beat_objects.empty()) {
    for (const auto& b : beat_objects) {
      if (!b.has("time") || b.isNull("time")) continue;
      record.beats.beats.push_back(b.getDouble("time"));
    }
  } else {
    for (const auto& time : p.getOptionalDoubleArray("beats")) {
      if (time) record.beats.beats.push_back(*time);
    }
  }
  record.beats.downbeats = p.getDoubleArray("downbeats");
  record.beats.time_signature = readOptionalInt(p, "timeSignature");
  record.beats.bpm = readOptionalDouble(p, "bpm");
  record.beats.shift_count = readOptionalInt(p, "beatShift");

  for (const auto& c : p.getArray("chords")) {
    ChordSegment seg;
    seg.label = c.getString("chord");
    seg.start = c.getDouble("start");
    seg.end = c.getDouble("end");
    seg.confidence = c.getFloat("confidence", 1.0f);
    record.chords.segments.push_back(seg);
  }

  for (const auto& s : p.getArray("synchronizedChords")) {
    record.synchronized_chords.push_back(
        {s.getString("chord"), s.getInt("beatIndex"), s.getInt("beatNum", 1)});
  }

  json::Parser legacy = p.getObject("chordCorrections");
  for (const auto& display : legacy.keys()) {
    if (legacy.isString(display)) {
      record.global_corrections[display] = legacy.getString(display);
      continue;
    }
    if (!legacy.isObject(display)) continue;

    json::Parser runs = legacy.getObject(display);
    for (const auto& occurrence : runs.keys()) {
      int one_based = 0;
      try {
        one_based = std::stoi(occurrence);
      } catch (const std::exception&) {
        one_based = 0;
      }
      if (one_based < 1) {
        CHORDGRID_LOG_WARN("Skipping correction for '" << display << "' with occurrence '"
                                                        << occurrence << "'");
        continue;
      }
      record.corrections.set({display, one_based - 1}, runs.getString(occurrence));
    }
  }

  record.original_chords = p.getStringArray("originalChords");
  record.corrected_chords = p.getStringArray("correctedChords");
  record.key_signature = readOptionalString(p, "keySignature");
  return record;
}

std::optional<AnalysisRecord> AnalysisRecord::fromJson(const std::string& text,
                                                       std::vector<Diagnostic>* diagnostics) {
  json::Parser p(text);
  int version = recordSchemaVersion(p);

  if (version < 1 || version > CURRENT_SCHEMA_VERSION) {
    CHORDGRID_LOG_WARN("Analysis record has unsupported schema_version " << version);
    if (diagnostics) {
      diagnostics->push_back({GridError::SchemaVersionUnsupported,
                              "schema_version " + std::to_string(version) + " not supported",
                              -1});
    }
    return std::nullopt;
  }

  if (version == 1) {
    AnalysisRecord record = migrateV1(p);
    CHORDGRID_LOG_INFO("Migrated schema 1 record '" << record.recording_id << "' ("
                                                    << record.beats.beats.size() << " beats)");
    return record;
  }
  return parseV2(p);
}

}  // namespace chordgrid
