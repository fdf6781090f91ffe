/**
 * @file beat_alignment.cpp
 * @brief Implementation of padding/shift estimation.
 */

#include "core/beat_alignment.h"

#include <algorithm>
#include <cmath>

#include "core/grid_types.h"

namespace chordgrid {

namespace {

constexpr double kDownbeatMatchSec = 0.05;

}  // namespace

double estimateBpm(const std::vector<double>& beats) {
  if (beats.size() < 2) return DEFAULT_BPM;

  std::vector<double> intervals;
  intervals.reserve(beats.size() - 1);
  for (size_t i = 1; i < beats.size(); ++i) {
    double gap = beats[i] - beats[i - 1];
    if (gap > 0.0) intervals.push_back(gap);
  }
  if (intervals.empty()) return DEFAULT_BPM;

  auto mid = intervals.begin() + static_cast<std::ptrdiff_t>(intervals.size() / 2);
  std::nth_element(intervals.begin(), mid, intervals.end());
  double median = *mid;
  return median > 0.0 ? 60.0 / median : DEFAULT_BPM;
}

int estimatePaddingCount(double first_beat_sec, double bpm, int beats_per_measure) {
  if (!(first_beat_sec > MIN_PADDING_LEAD_IN_SEC) || !(bpm > 0.0)) return 0;

  double raw = std::floor((first_beat_sec / 60.0) * bpm);
  if (!std::isfinite(raw)) return 0;
  double beat_duration = std::round((60.0 / bpm) * 1000.0) / 1000.0;
  double gap_ratio = beat_duration > 0.0 ? first_beat_sec / beat_duration : 0.0;
  if (raw == 0.0) return gap_ratio > MIN_PADDING_GAP_RATIO ? 1 : 0;

  // Reduce in floating point; raw can exceed the int range for absurd tempos.
  int measure = beats_per_measure > 0 ? beats_per_measure : DEFAULT_BEATS_PER_MEASURE;
  if (raw < static_cast<double>(measure)) return static_cast<int>(raw);
  if (beats_per_measure <= 0) return measure - 1;
  int trimmed = static_cast<int>(std::fmod(raw, static_cast<double>(measure)));
  return trimmed == 0 ? measure - 1 : trimmed;
}

int calculateOptimalShift(const std::vector<std::string>& chords, int beats_per_measure,
                          int padding_count) {
  if (chords.empty() || beats_per_measure <= 0) return 0;

  int best_shift = 0;
  int best_changes = -1;
  for (int shift = 0; shift < beats_per_measure; ++shift) {
    int changes = 0;
    std::string previous_downbeat_chord;

    for (size_t i = 0; i < chords.size(); ++i) {
      size_t visual = static_cast<size_t>(padding_count + shift) + i;
      bool is_downbeat = visual % static_cast<size_t>(beats_per_measure) == 0;
      if (!is_downbeat) continue;

      const std::string& current = chords[i];
      bool valid = !current.empty();
      bool starts_here = i == 0 || chords[i - 1] != current;
      if (valid && !previous_downbeat_chord.empty() && current != previous_downbeat_chord &&
          starts_here) {
        ++changes;
      }
      if (valid) previous_downbeat_chord = current;
    }

    // Strict comparison keeps the smaller shift on ties.
    if (changes > best_changes) {
      best_changes = changes;
      best_shift = shift;
    }
  }
  return best_shift;
}

std::optional<int> shiftFromDownbeats(const std::vector<double>& beats,
                                      const std::vector<double>& downbeats,
                                      int beats_per_measure, int padding_count) {
  if (beats.empty() || downbeats.empty() || beats_per_measure <= 0) return std::nullopt;

  std::vector<double> sorted = downbeats;
  std::sort(sorted.begin(), sorted.end());
  for (double downbeat : sorted) {
    auto it = std::lower_bound(beats.begin(), beats.end(), downbeat - kDownbeatMatchSec);
    if (it == beats.end() || std::abs(*it - downbeat) > kDownbeatMatchSec) continue;
    int index = static_cast<int>(it - beats.begin());
    int offset = (padding_count + index) % beats_per_measure;
    return (beats_per_measure - offset) % beats_per_measure;
  }
  return std::nullopt;
}

}  // namespace chordgrid
