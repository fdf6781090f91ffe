/**
 * @file grid_builder.cpp
 * @brief Implementation of the grid fusion pipeline.
 */

#include "core/grid_builder.h"

#include "core/beat_alignment.h"
#include "core/chord_beat_mapper.h"
#include "core/logging.h"
#include "core/occurrence_tracker.h"

namespace chordgrid {

int resolveBeatsPerMeasure(const BeatDetection& beats, const GridBuildOptions& options) {
  if (options.beats_per_measure) return *options.beats_per_measure;
  if (beats.time_signature) return *beats.time_signature;
  return options.default_beats_per_measure;
}

GridBuildResult GridBuilder::build(const BeatDetection& beats, const ChordDetection& chords,
                                   const GridBuildOptions& options) const {
  GridBuildResult result;
  result.beat_times = sanitizeBeatTimes(beats.beats, &result.diagnostics);

  ChordBeatMapper mapper(normalizer_);
  std::vector<std::optional<NormalizedChord>> beat_chords =
      mapper.mapTimes(result.beat_times, chords.segments, &result.diagnostics);
  if (options.simplify_chords) {
    for (auto& chord : beat_chords) {
      if (chord) chord = simplifyChord(*chord);
    }
  }

  BeatGridOptions grid_options;
  grid_options.beats_per_measure = resolveBeatsPerMeasure(beats, options);

  // Padding first: the optimal shift depends on it.
  if (options.padding_count) {
    grid_options.padding_count = *options.padding_count;
  } else if (beats.padding_count) {
    grid_options.padding_count = *beats.padding_count;
  } else if (options.auto_align && !result.beat_times.empty()) {
    double tempo = beats.bpm && *beats.bpm > 0.0 ? *beats.bpm : estimateBpm(result.beat_times);
    grid_options.padding_count = estimatePaddingCount(result.beat_times.front(), tempo,
                                                      grid_options.beats_per_measure);
  }
  grid_options.padding_count = clampPaddingCount(
      grid_options.padding_count, grid_options.beats_per_measure, &result.diagnostics);

  if (options.shift_count) {
    grid_options.shift_count = *options.shift_count;
  } else if (beats.shift_count) {
    grid_options.shift_count = *beats.shift_count;
  } else if (options.auto_align) {
    std::optional<int> from_downbeats =
        shiftFromDownbeats(result.beat_times, beats.downbeats, grid_options.beats_per_measure,
                           grid_options.padding_count);
    if (from_downbeats) {
      grid_options.shift_count = *from_downbeats;
    } else {
      std::vector<std::string> labels;
      labels.reserve(beat_chords.size());
      for (const auto& chord : beat_chords) labels.push_back(chord ? chord->display : "");
      grid_options.shift_count = calculateOptimalShift(labels, grid_options.beats_per_measure,
                                                       grid_options.padding_count);
    }
  }

  result.grid = BeatGridBuilder(grid_options)
                    .build(result.beat_times, beats.downbeats, &result.diagnostics);
  result.cells = ChordBeatMapper::assembleCells(result.grid, beat_chords);
  result.occurrences = OccurrenceTracker::track(result.cells);

  CHORDGRID_LOG_INFO("Grid built: " << result.cells.size() << " cells ("
                                    << result.grid.padding_count << " padding, shift "
                                    << result.grid.shift_count << ", "
                                    << result.grid.beats_per_measure << "/measure), "
                                    << result.diagnostics.size() << " diagnostics");
  return result;
}

std::vector<SynchronizedChord> synchronizedChords(const std::vector<GridCell>& cells) {
  std::vector<SynchronizedChord> result;
  int audio_index = 0;
  for (const auto& cell : cells) {
    if (cell.is_padding) continue;
    result.push_back(
        {cell.chord ? cell.chord->display : NO_CHORD_LABEL, audio_index, cell.beat_number});
    ++audio_index;
  }
  return result;
}

std::vector<AudioMapping> audioMapping(const std::vector<GridCell>& cells) {
  std::vector<AudioMapping> result;
  size_t audio_index = 0;
  for (size_t i = 0; i < cells.size(); ++i) {
    const GridCell& cell = cells[i];
    if (!isClickable(cell)) continue;
    result.push_back({cell.display(), *cell.timestamp, i, audio_index});
    ++audio_index;
  }
  return result;
}

}  // namespace chordgrid
