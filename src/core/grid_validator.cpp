/**
 * @file grid_validator.cpp
 * @brief Implementation of GridValidator.
 */

#include "core/grid_validator.h"

#include <algorithm>
#include <sstream>

#include "core/json_helpers.h"
#include "core/logging.h"

namespace chordgrid {

namespace {

// Per-index issues listed before only the summary is kept.
constexpr size_t kMaxIndexIssues = 8;

const char* severityName(ValidationSeverity severity) {
  switch (severity) {
    case ValidationSeverity::Error: return "error";
    case ValidationSeverity::Warning: return "warning";
    case ValidationSeverity::Info: return "info";
  }
  return "info";
}

}  // namespace

size_t GridValidationReport::errorCount() const {
  size_t count = 0;
  for (const auto& issue : issues) {
    if (issue.severity == ValidationSeverity::Error) ++count;
  }
  return count;
}

size_t GridValidationReport::warningCount() const {
  size_t count = 0;
  for (const auto& issue : issues) {
    if (issue.severity == ValidationSeverity::Warning) ++count;
  }
  return count;
}

std::string GridValidationReport::toJson() const {
  std::ostringstream ss;
  json::Writer w(ss, true);
  w.beginObject()
      .write("valid", valid)
      .beginObject("summary")
      .write("beat_count", beat_count)
      .write("index_count", index_count)
      .write("max_index", max_index)
      .write("out_of_range", out_of_range)
      .write("error_count", errorCount())
      .write("warning_count", warningCount())
      .endObject();

  w.beginArray("issues");
  for (const auto& issue : issues) {
    w.beginObject()
        .write("severity", severityName(issue.severity))
        .write("code", gridErrorName(issue.code))
        .write("message", issue.message);
    if (issue.beat_index >= 0) w.write("beat_index", issue.beat_index);
    w.endObject();
  }
  w.endArray().endObject();
  return ss.str();
}

std::string GridValidationReport::toTextReport(const std::string& source) const {
  std::ostringstream ss;

  ss << std::string(60, '=') << "\n";
  ss << "Grid Consistency Report";
  if (!source.empty()) ss << ": " << source;
  ss << "\n";
  ss << std::string(60, '=') << "\n";
  ss << "Beats loaded: " << beat_count << "\n";
  ss << "Persisted indices: " << index_count;
  if (max_index >= 0) ss << " (max " << max_index << ")";
  ss << "\n\n";

  if (!issues.empty()) {
    ss << "--- Issues ---\n";
    for (const auto& issue : issues) {
      ss << "  [" << severityName(issue.severity) << "] " << gridErrorName(issue.code) << ": "
         << issue.message << "\n";
    }
    ss << "\n";
  }

  ss << "Result: " << (valid ? "VALID" : "INVALID") << " (" << errorCount() << " errors, "
     << warningCount() << " warnings)\n";
  return ss.str();
}

size_t GridValidator::realBeatCount(const std::vector<GridCell>& cells) {
  return static_cast<size_t>(
      std::count_if(cells.begin(), cells.end(), [](const GridCell& c) { return !c.is_padding; }));
}

GridValidationReport GridValidator::validate(size_t beat_count,
                                             const std::vector<int>& persisted_indices) const {
  GridValidationReport report;
  report.beat_count = beat_count;
  report.index_count = persisted_indices.size();

  if (beat_count == 0) {
    addInfo(report, GridError::BeatArrayEmpty, "beat array is empty");
  }

  int previous = -1;
  bool reported_order = false;
  size_t listed = 0;
  for (size_t i = 0; i < persisted_indices.size(); ++i) {
    int index = persisted_indices[i];
    report.max_index = std::max(report.max_index, index);

    bool in_range = index >= 0 && static_cast<size_t>(index) < beat_count;
    if (!in_range) {
      ++report.out_of_range;
      if (listed < kMaxIndexIssues) {
        addError(report, GridError::IndexOutOfRange,
                 "persisted beat index " + std::to_string(index) + " outside [0, " +
                     std::to_string(beat_count) + ")",
                 index);
        ++listed;
      }
    }

    if (index < previous && !reported_order) {
      addWarning(report, GridError::NonMonotonicBeat,
                 "persisted beat indices decrease at entry " + std::to_string(i), index);
      reported_order = true;
    }
    previous = index;
  }

  if (report.out_of_range > listed) {
    addError(report, GridError::IndexOutOfRange,
             std::to_string(report.out_of_range - listed) + " further indices out of range");
  }

  report.valid = !report.hasErrors();
  if (!report.valid) {
    CHORDGRID_LOG_WARN("Persisted grid does not match loaded beats: max index "
                       << report.max_index << " for " << beat_count << " beats ("
                       << report.out_of_range << " out of range); cached analysis is stale");
  }
  return report;
}

GridValidationReport GridValidator::validate(const std::vector<GridCell>& cells,
                                             const std::vector<int>& persisted_indices) const {
  GridValidationReport report = validate(realBeatCount(cells), persisted_indices);

  for (size_t i = 0; i < cells.size(); ++i) {
    if (cells[i].beat_index != i) {
      addError(report, GridError::IndexOutOfRange,
               "cell " + std::to_string(i) + " carries beat index " +
                   std::to_string(cells[i].beat_index),
               static_cast<int>(i));
      break;
    }
  }
  report.valid = !report.hasErrors();
  return report;
}

GridValidationReport GridValidator::validate(
    const std::vector<GridCell>& cells, const std::vector<SynchronizedChord>& synchronized) const {
  std::vector<int> indices;
  indices.reserve(synchronized.size());
  for (const auto& entry : synchronized) indices.push_back(entry.beat_index);
  return validate(cells, indices);
}

void GridValidator::addError(GridValidationReport& report, GridError code, const std::string& msg,
                             int index) {
  report.issues.push_back({ValidationSeverity::Error, code, msg, index});
}

void GridValidator::addWarning(GridValidationReport& report, GridError code,
                               const std::string& msg, int index) {
  report.issues.push_back({ValidationSeverity::Warning, code, msg, index});
}

void GridValidator::addInfo(GridValidationReport& report, GridError code, const std::string& msg,
                            int index) {
  report.issues.push_back({ValidationSeverity::Info, code, msg, index});
}

}  // namespace chordgrid
