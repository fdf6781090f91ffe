/**
 * @file beat_grid.cpp
 * @brief Implementation of BeatGridBuilder.
 */

#include "core/beat_grid.h"

#include <algorithm>
#include <cmath>

#include "core/logging.h"

namespace chordgrid {

namespace {

// Maximum distance between a reported downbeat and the beat it labels.
constexpr double kDownbeatToleranceSec = 0.05;

bool matchesDownbeat(double time, const std::vector<double>& sorted_downbeats) {
  auto it = std::lower_bound(sorted_downbeats.begin(), sorted_downbeats.end(),
                             time - kDownbeatToleranceSec);
  return it != sorted_downbeats.end() && std::abs(*it - time) <= kDownbeatToleranceSec;
}

}  // namespace

int positionInMeasure(size_t index, int beats_per_measure, int shift_count) {
  if (beats_per_measure <= 0) return 1;
  int shift = ((shift_count % beats_per_measure) + beats_per_measure) % beats_per_measure;
  return static_cast<int>((index + static_cast<size_t>(shift)) %
                          static_cast<size_t>(beats_per_measure)) +
         1;
}

int clampPaddingCount(int padding_count, int beats_per_measure,
                      std::vector<Diagnostic>* diagnostics) {
  if (padding_count <= 0) return 0;
  int limit = beats_per_measure > 0 ? beats_per_measure : DEFAULT_BEATS_PER_MEASURE;
  if (padding_count < limit) return padding_count;

  int clamped = beats_per_measure > 0 ? padding_count % beats_per_measure : limit - 1;
  CHORDGRID_LOG_WARN("Padding " << padding_count << " reduced to " << clamped
                                << ": padding must stay below one measure");
  if (diagnostics) {
    diagnostics->push_back({GridError::PaddingOutOfRange,
                            "padding " + std::to_string(padding_count) + " reduced to " +
                                std::to_string(clamped),
                            -1});
  }
  return clamped;
}

std::vector<double> sanitizeBeatTimes(const std::vector<double>& timestamps,
                                      std::vector<Diagnostic>* diagnostics) {
  std::vector<double> kept;
  kept.reserve(timestamps.size());
  for (size_t i = 0; i < timestamps.size(); ++i) {
    double t = timestamps[i];
    bool valid = std::isfinite(t) && t >= 0.0 && (kept.empty() || t > kept.back());
    if (valid) {
      kept.push_back(t);
      continue;
    }
    CHORDGRID_LOG_WARN("Dropping beat " << i << " at " << t
                                        << "s: timestamps must be finite, non-negative and "
                                           "strictly increasing");
    if (diagnostics) {
      diagnostics->push_back({GridError::NonMonotonicBeat,
                              "beat timestamp " + std::to_string(t) + " dropped",
                              static_cast<int>(i)});
    }
  }
  return kept;
}

BeatGrid BeatGridBuilder::build(const std::vector<double>& timestamps,
                                const std::vector<double>& downbeats,
                                std::vector<Diagnostic>* diagnostics) const {
  BeatGrid grid;
  grid.beats_per_measure = options_.beats_per_measure;
  grid.padding_count =
      clampPaddingCount(options_.padding_count, options_.beats_per_measure, diagnostics);
  grid.shift_count = 0;
  if (options_.beats_per_measure > 0) {
    int bpm = options_.beats_per_measure;
    grid.shift_count = ((options_.shift_count % bpm) + bpm) % bpm;
  }

  std::vector<double> beats = sanitizeBeatTimes(timestamps, diagnostics);
  if (beats.empty()) {
    CHORDGRID_LOG_INFO("No usable beats; grid is empty");
    if (diagnostics) {
      diagnostics->push_back({GridError::BeatArrayEmpty, "no beats supplied", -1});
    }
    grid.padding_count = 0;
    return grid;
  }

  std::vector<double> sorted_downbeats = downbeats;
  std::sort(sorted_downbeats.begin(), sorted_downbeats.end());
  const bool signature_known = grid.beats_per_measure > 0;
  const bool use_downbeat_hints = signature_known && !sorted_downbeats.empty();

  grid.frames.reserve(static_cast<size_t>(grid.padding_count) + beats.size());
  for (int i = 0; i < grid.padding_count; ++i) {
    BeatFrame frame;
    frame.is_padding = true;
    frame.position_in_measure =
        positionInMeasure(static_cast<size_t>(i), grid.beats_per_measure, grid.shift_count);
    frame.is_downbeat = signature_known && frame.position_in_measure == 1;
    grid.frames.push_back(frame);
  }

  for (double time : beats) {
    BeatFrame frame;
    frame.timestamp = time;
    frame.position_in_measure =
        positionInMeasure(grid.frames.size(), grid.beats_per_measure, grid.shift_count);
    if (use_downbeat_hints) {
      frame.is_downbeat = matchesDownbeat(time, sorted_downbeats);
    } else {
      frame.is_downbeat = signature_known && frame.position_in_measure == 1;
    }
    grid.frames.push_back(frame);
  }

  CHORDGRID_LOG_DEBUG("Beat grid: " << beats.size() << " beats, padding=" << grid.padding_count
                                    << ", shift=" << grid.shift_count
                                    << ", beats_per_measure=" << grid.beats_per_measure);
  return grid;
}

}  // namespace chordgrid
