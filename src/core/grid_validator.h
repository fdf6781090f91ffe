/**
 * @file grid_validator.h
 * @brief Consistency checks between a beat grid and persisted chord indices.
 */

#ifndef CHORDGRID_CORE_GRID_VALIDATOR_H
#define CHORDGRID_CORE_GRID_VALIDATOR_H

#include <string>
#include <vector>

#include "core/grid_types.h"

namespace chordgrid {

// Validation issue severity
enum class ValidationSeverity { Info, Warning, Error };

// Single validation issue
struct ValidationIssue {
  ValidationSeverity severity = ValidationSeverity::Info;
  GridError code = GridError::IndexOutOfRange;
  std::string message;
  int beat_index = -1;  // Offending index (-1 if not index-specific)
};

// Full validation report
struct GridValidationReport {
  bool valid = false;
  size_t beat_count = 0;      // Real beats in the loaded grid
  size_t index_count = 0;     // Persisted indices checked
  int max_index = -1;         // Largest persisted index (-1 if none)
  size_t out_of_range = 0;    // Indices outside [0, beat_count)
  std::vector<ValidationIssue> issues;

  size_t errorCount() const;
  size_t warningCount() const;
  bool hasErrors() const { return errorCount() > 0; }

  // Convert to JSON string
  std::string toJson() const;

  // Print text report to string
  std::string toTextReport(const std::string& source = "") const;
};

/**
 * @brief Detects grids persisted against a different beat array.
 *
 * Violations are reported, never corrected: the caller decides whether to
 * discard a cached analysis.
 */
class GridValidator {
 public:
  GridValidator() = default;

  // Validate persisted indices against a beat count
  GridValidationReport validate(size_t beat_count, const std::vector<int>& persisted_indices) const;

  // Validate persisted indices against the real (non-padding) cells of a grid
  GridValidationReport validate(const std::vector<GridCell>& cells,
                                const std::vector<int>& persisted_indices) const;

  // Validate persisted synchronized chords against a grid
  GridValidationReport validate(const std::vector<GridCell>& cells,
                                const std::vector<SynchronizedChord>& synchronized) const;

  // Number of non-padding cells
  static size_t realBeatCount(const std::vector<GridCell>& cells);

 private:
  static void addError(GridValidationReport& report, GridError code, const std::string& msg,
                       int index = -1);
  static void addWarning(GridValidationReport& report, GridError code, const std::string& msg,
                         int index = -1);
  static void addInfo(GridValidationReport& report, GridError code, const std::string& msg,
                      int index = -1);
};

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_GRID_VALIDATOR_H
