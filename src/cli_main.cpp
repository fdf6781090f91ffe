/**
 * @file cli_main.cpp
 * @brief Command-line interface for building, inspecting and validating chord grids.
 */

#include "chordgrid.h"
#include "core/json_helpers.h"
#include "core/logging.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

namespace {

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " --input FILE [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --input FILE          Analysis record (JSON, schema 1 or 2)\n";
  std::cout << "  --config FILE         Grid configuration (JSON)\n";
  std::cout << "  --beats-per-measure N Override time signature (0 = unknown)\n";
  std::cout << "  --shift N             Override beat shift\n";
  std::cout << "  --padding N           Override padding beats\n";
  std::cout << "  --transpose N         Pitch-shift displayed chords (-6..6 semitones)\n";
  std::cout << "  --simplify            Reduce chords to major/minor/aug/dim/sus\n";
  std::cout << "  --no-corrections      Show detected chords without corrections\n";
  std::cout << "  --validate            Check persisted beat indices, exit 2 if stale\n";
  std::cout << "  --json                Output JSON to stdout\n";
  std::cout << "  --output FILE         Write the updated analysis record\n";
  std::cout << "  --verbose             Debug logging\n";
  std::cout << "  --help                Show this help message\n";
}

bool readFile(const std::string& path, std::string& out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return false;
  std::ostringstream ss;
  ss << file.rdbuf();
  out = ss.str();
  return true;
}

std::string formatTime(const std::optional<double>& t) {
  if (!t) return "--";
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << *t;
  return ss.str();
}

// Print measures as rows; a label appears where its run starts.
void printGrid(const chordgrid::ChordGrid& grid, bool show_corrected) {
  const auto& cells = grid.cells();
  const auto& result = grid.result();

  std::cout << "Grid: " << cells.size() << " beats (" << result.grid.padding_count
            << " padding), shift " << result.grid.shift_count << ", "
            << result.grid.beats_per_measure << " beats/measure";
  if (grid.transpose() != 0) {
    std::cout << ", transposed " << std::showpos << grid.transpose() << std::noshowpos;
    if (!grid.targetKey().empty()) std::cout << " to " << grid.targetKey();
  }
  std::cout << "\n\n";

  int measure = 0;
  for (size_t i = 0; i < cells.size(); ++i) {
    const auto& cell = cells[i];
    bool new_row = i == 0 || (result.grid.beats_per_measure > 0 && cell.beat_number == 1);
    if (new_row) {
      if (i > 0) std::cout << "|\n";
      std::cout << std::setw(4) << ++measure << " " << std::setw(7) << formatTime(cell.timestamp)
                << " ";
    }

    std::string label = ".";
    if (cell.is_padding) {
      label = "_";
    } else if (grid.shouldShowLabel(i, show_corrected)) {
      auto shown = grid.getDisplay(i, show_corrected);
      label = shown.label + (shown.was_corrected ? "*" : "");
    }
    std::cout << "| " << std::left << std::setw(8) << label << std::right;
  }
  if (!cells.empty()) std::cout << "|\n";
  std::cout << "\n(* = corrected, _ = padding)\n";
}

std::string gridToJson(const chordgrid::ChordGrid& grid, bool show_corrected) {
  std::ostringstream ss;
  chordgrid::json::Writer w(ss, true);
  const auto& result = grid.result();

  w.beginObject()
      .write("recording_id", grid.recordingId())
      .write("beats_per_measure", result.grid.beats_per_measure)
      .write("shift_count", result.grid.shift_count)
      .write("padding_count", result.grid.padding_count)
      .write("transpose", grid.transpose());
  if (!grid.targetKey().empty()) w.write("key", grid.targetKey());

  w.beginArray("cells");
  for (size_t i = 0; i < grid.cells().size(); ++i) {
    const auto& cell = grid.cells()[i];
    auto shown = grid.getDisplay(i, show_corrected);
    w.beginObject().write("beat_index", cell.beat_index);
    if (cell.timestamp) {
      w.write("timestamp", *cell.timestamp);
    } else {
      w.writeNull("timestamp");
    }
    w.write("beat_num", cell.beat_number)
        .write("downbeat", cell.is_downbeat)
        .write("padding", cell.is_padding)
        .write("chord", cell.display())
        .write("display", shown.label)
        .write("corrected", shown.was_corrected)
        .write("occurrence", grid.occurrences()[i].occurrence)
        .write("show_label", grid.shouldShowLabel(i, show_corrected))
        .endObject();
  }
  w.endArray();

  w.beginArray("diagnostics");
  for (const auto& diag : grid.diagnostics()) {
    w.beginObject()
        .write("code", chordgrid::gridErrorName(diag.code))
        .write("message", diag.message)
        .write("beat_index", diag.beat_index)
        .endObject();
  }
  w.endArray().endObject();
  return ss.str();
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string input_file;
  std::string config_file;
  std::string output_file;
  std::optional<int> beats_per_measure;
  std::optional<int> shift;
  std::optional<int> padding;
  int transpose = 0;
  bool simplify = false;
  bool no_corrections = false;
  bool validate_only = false;
  bool json_output = false;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
      input_file = argv[++i];
    } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_file = argv[++i];
    } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
      output_file = argv[++i];
    } else if (std::strcmp(argv[i], "--beats-per-measure") == 0 && i + 1 < argc) {
      beats_per_measure = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
    } else if (std::strcmp(argv[i], "--shift") == 0 && i + 1 < argc) {
      shift = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
    } else if (std::strcmp(argv[i], "--padding") == 0 && i + 1 < argc) {
      padding = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
    } else if (std::strcmp(argv[i], "--transpose") == 0 && i + 1 < argc) {
      transpose = static_cast<int>(std::strtol(argv[++i], nullptr, 10));
    } else if (std::strcmp(argv[i], "--simplify") == 0) {
      simplify = true;
    } else if (std::strcmp(argv[i], "--no-corrections") == 0) {
      no_corrections = true;
    } else if (std::strcmp(argv[i], "--validate") == 0) {
      validate_only = true;
    } else if (std::strcmp(argv[i], "--json") == 0) {
      json_output = true;
    } else if (std::strcmp(argv[i], "--verbose") == 0) {
      verbose = true;
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (input_file.empty()) {
    printUsage(argv[0]);
    return 1;
  }

  chordgrid::GridConfig config;
  if (!config_file.empty()) {
    std::string text;
    if (!readFile(config_file, text)) {
      std::cerr << "Error: Failed to open config: " << config_file << "\n";
      return 1;
    }
    config = chordgrid::GridConfig::fromJson(text);
  }
  if (beats_per_measure) config.beats_per_measure = *beats_per_measure;
  if (simplify) config.simplify_chords = true;
  if (no_corrections) config.show_corrected = false;
  if (verbose) config.verbose = true;

  chordgrid::setLogVerbosity(config.verbose ? chordgrid::LogVerbosity::Debug
                                            : chordgrid::LogVerbosity::Warn);

  std::string text;
  if (!readFile(input_file, text)) {
    std::cerr << "Error: Failed to open file: " << input_file << "\n";
    return 1;
  }

  std::vector<chordgrid::Diagnostic> load_diagnostics;
  auto record = chordgrid::AnalysisRecord::fromJson(text, &load_diagnostics);
  if (!record) {
    for (const auto& diag : load_diagnostics) {
      std::cerr << "Error: " << chordgrid::gridErrorName(diag.code) << ": " << diag.message
                << "\n";
    }
    return 1;
  }

  chordgrid::ChordGrid grid(config);
  auto report = grid.loadRecord(*record);
  if (beats_per_measure) grid.setBeatsPerMeasure(*beats_per_measure);
  if (shift || padding) grid.rebuild(shift, padding);
  if (transpose != 0) grid.setTranspose(transpose);

  if (validate_only) {
    if (json_output) {
      std::cout << report.toJson() << "\n";
    } else {
      std::cout << "chordgrid v" << chordgrid::ChordGrid::version() << "\n\n";
      std::cout << report.toTextReport(record->cacheKey());
    }
    return report.valid ? 0 : 2;
  }

  if (json_output) {
    std::cout << gridToJson(grid, config.show_corrected) << "\n";
  } else {
    std::cout << "chordgrid v" << chordgrid::ChordGrid::version() << "\n\n";
    std::cout << "Recording: " << record->cacheKey() << "\n";
    printGrid(grid, config.show_corrected);
    if (!report.valid) {
      std::cerr << "\nWARNING: stored synchronized chords do not match the beat array ("
                << report.out_of_range << " out of range)\n";
    }
  }

  if (!output_file.empty()) {
    std::ofstream file(output_file);
    if (!file) {
      std::cerr << "Error: Failed to write: " << output_file << "\n";
      return 1;
    }
    file << grid.toRecord().toJson() << "\n";
    if (!json_output) std::cout << "Wrote " << output_file << "\n";
  }

  return 0;
}
