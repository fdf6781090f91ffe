/**
 * @file chord_beat_mapper.cpp
 * @brief Implementation of chord-to-beat mapping.
 */

#include "core/chord_beat_mapper.h"

#include "core/logging.h"

namespace chordgrid {

std::optional<size_t> segmentAt(const std::vector<ChordSegment>& segments, double time,
                                int* containing_count) {
  std::optional<size_t> containing;
  std::optional<size_t> latest_started;
  int count = 0;

  for (size_t i = 0; i < segments.size(); ++i) {
    const ChordSegment& seg = segments[i];
    if (seg.start > time) continue;

    if (!latest_started || seg.start >= segments[*latest_started].start) {
      latest_started = i;
    }
    if (time < seg.end) {
      ++count;
      if (!containing || seg.start >= segments[*containing].start) {
        containing = i;
      }
    }
  }

  if (containing_count) *containing_count = count;
  return containing ? containing : latest_started;
}

std::vector<std::optional<NormalizedChord>> ChordBeatMapper::mapTimes(
    const std::vector<double>& times, const std::vector<ChordSegment>& segments,
    std::vector<Diagnostic>* diagnostics) {
  // Normalize every segment label once, up front.
  std::vector<std::optional<NormalizedChord>> segment_chords;
  segment_chords.reserve(segments.size());
  for (size_t i = 0; i < segments.size(); ++i) {
    NormalizeResult result = normalizer_.normalize(segments[i].label);
    if (result.status == LabelStatus::Invalid) {
      CHORDGRID_LOG_WARN("Invalid chord label '" << segments[i].label << "' at "
                                                 << segments[i].start
                                                 << "s, treating as no chord");
      if (diagnostics) {
        diagnostics->push_back(
            {GridError::InvalidChordLabel, "invalid chord label '" + segments[i].label + "'", -1});
      }
    }
    segment_chords.push_back(result.chord);
  }

  std::vector<std::optional<NormalizedChord>> chords;
  chords.reserve(times.size());
  for (size_t beat = 0; beat < times.size(); ++beat) {
    int containing = 0;
    auto seg = segmentAt(segments, times[beat], &containing);
    if (containing > 1) {
      CHORDGRID_LOG_DEBUG("Beat " << beat << " at " << times[beat] << "s covered by "
                                  << containing << " segments, using latest start");
      if (diagnostics) {
        diagnostics->push_back({GridError::AmbiguousSegmentOverlap,
                                std::to_string(containing) + " segments overlap beat",
                                static_cast<int>(beat)});
      }
    }
    chords.push_back(seg ? segment_chords[*seg] : std::nullopt);
  }
  return chords;
}

std::vector<GridCell> ChordBeatMapper::assembleCells(
    const BeatGrid& grid, const std::vector<std::optional<NormalizedChord>>& chords) {
  std::vector<GridCell> cells;
  cells.reserve(grid.frames.size());

  size_t real_index = 0;
  for (size_t i = 0; i < grid.frames.size(); ++i) {
    const BeatFrame& frame = grid.frames[i];
    GridCell cell;
    cell.beat_index = i;
    cell.timestamp = frame.timestamp;
    cell.beat_number = frame.position_in_measure;
    cell.is_downbeat = frame.is_downbeat;
    cell.is_padding = frame.is_padding;
    if (!frame.is_padding) {
      if (real_index < chords.size()) cell.chord = chords[real_index];
      ++real_index;
    }
    cells.push_back(std::move(cell));
  }
  return cells;
}

std::vector<GridCell> ChordBeatMapper::map(const BeatGrid& grid,
                                           const std::vector<ChordSegment>& segments,
                                           std::vector<Diagnostic>* diagnostics) {
  std::vector<double> times;
  times.reserve(grid.frames.size());
  for (const auto& frame : grid.frames) {
    if (frame.timestamp) times.push_back(*frame.timestamp);
  }
  return assembleCells(grid, mapTimes(times, segments, diagnostics));
}

}  // namespace chordgrid
