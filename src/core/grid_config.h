/**
 * @file grid_config.h
 * @brief Session configuration for grid building and display.
 */

#ifndef CHORDGRID_CORE_GRID_CONFIG_H
#define CHORDGRID_CORE_GRID_CONFIG_H

#include <cstdint>
#include <string>

#include "core/grid_types.h"
#include "core/json_helpers.h"

namespace chordgrid {

/**
 * @brief Options of one ChordGrid session.
 *
 * Loaded from JSON with readFrom(); missing keys keep their defaults.
 */
struct GridConfig {
  int beats_per_measure = DEFAULT_BEATS_PER_MEASURE;  ///< Used when the detector reports none
  bool auto_align = true;          ///< Estimate padding/shift when no hints are given
  bool simplify_chords = false;    ///< Reduce displays to the five chord families
  bool show_corrected = true;      ///< Default for getDisplay() when not given explicitly
  uint32_t normalizer_cache_capacity = 256;  ///< 0 disables memoization
  bool verbose = false;            ///< Debug logging

  template <typename Self, typename V>
  static void visitFields(Self&& self, V&& v) {
    v("beats_per_measure", self.beats_per_measure);
    v("auto_align", self.auto_align);
    v("simplify_chords", self.simplify_chords);
    v("show_corrected", self.show_corrected);
    v("normalizer_cache_capacity", self.normalizer_cache_capacity);
    v("verbose", self.verbose);
  }

  void writeTo(json::Writer& w) const {
    json::WriteVisitor v{w};
    visitFields(*this, v);
  }

  void readFrom(const json::Parser& p) {
    json::ReadVisitor v{p};
    visitFields(*this, v);
  }

  /// @brief Serialize as a standalone JSON object.
  std::string toJson(bool pretty = true) const;

  /// @brief Parse from JSON text; unknown keys are ignored.
  static GridConfig fromJson(const std::string& text);
};

}  // namespace chordgrid

#endif  // CHORDGRID_CORE_GRID_CONFIG_H
