/**
 * @file occurrence_tracker_test.cpp
 * @brief Tests for run numbering and label visibility.
 */

#include "core/occurrence_tracker.h"

#include <gtest/gtest.h>

#include "core/beat_grid.h"
#include "core/chord_beat_mapper.h"
#include "core/chord_normalizer.h"
#include "test_support/test_helpers.h"

namespace chordgrid {
namespace {

std::vector<int> occurrenceIndices(const std::vector<OccurrenceKey>& keys) {
  std::vector<int> result;
  for (const auto& key : keys) result.push_back(key.occurrence);
  return result;
}

TEST(OccurrenceTrackerTest, SeparateRunsOfSameChord) {
  auto keys = OccurrenceTracker::track(std::vector<std::string>{"C", "C", "G", "G", "G", "C"});
  ASSERT_EQ(keys.size(), 6u);

  // First run of C is 0, second run of C is 1; the single G run is 0.
  EXPECT_EQ(keys[0], (OccurrenceKey{"C", 0}));
  EXPECT_EQ(keys[1], (OccurrenceKey{"C", 0}));
  EXPECT_EQ(keys[2], (OccurrenceKey{"G", 0}));
  EXPECT_EQ(keys[3], (OccurrenceKey{"G", 0}));
  EXPECT_EQ(keys[4], (OccurrenceKey{"G", 0}));
  EXPECT_EQ(keys[5], (OccurrenceKey{"C", 1}));
}

TEST(OccurrenceTrackerTest, EmptyCellsBreakRuns) {
  auto keys = OccurrenceTracker::track(std::vector<std::string>{"C", "", "C", "C", "", "", "C"});
  EXPECT_EQ(occurrenceIndices(keys), (std::vector<int>{0, 0, 1, 1, 1, 1, 2}));
  EXPECT_EQ(keys[1].display, "");
  EXPECT_EQ(keys[4], (OccurrenceKey{"", 1}));
}

TEST(OccurrenceTrackerTest, CountersArePerDisplay) {
  auto keys =
      OccurrenceTracker::track(std::vector<std::string>{"Am", "F", "Am", "G", "F", "Am"});
  EXPECT_EQ(occurrenceIndices(keys), (std::vector<int>{0, 0, 1, 0, 1, 2}));
}

TEST(OccurrenceTrackerTest, EmptyInput) {
  EXPECT_TRUE(OccurrenceTracker::track(std::vector<std::string>{}).empty());
  EXPECT_TRUE(OccurrenceTracker::track(std::vector<GridCell>{}).empty());
}

TEST(OccurrenceTrackerTest, CellsAndLabelsAgree) {
  ChordNormalizer normalizer;
  ChordBeatMapper mapper(normalizer);
  BeatGridOptions options;
  options.padding_count = 1;
  BeatGrid grid = BeatGridBuilder(options).build(test::evenBeats(10), {});
  auto cells = mapper.map(grid, test::segmentsFor({{"C", 3}, {"G", 2}, {"C", 3}, {"N", 2}}));

  auto from_cells = OccurrenceTracker::track(cells);
  auto from_labels = OccurrenceTracker::track(test::cellLabels(cells));
  EXPECT_EQ(from_cells, from_labels);
  EXPECT_EQ(from_cells[1], (OccurrenceKey{"C", 0}));
  EXPECT_EQ(from_cells[6], (OccurrenceKey{"C", 1}));
}

TEST(OccurrenceTrackerTest, RecomputedKeysAreStable) {
  std::vector<std::string> labels = {"C", "C", "G", "Am", "Am", "G", "C"};
  EXPECT_EQ(OccurrenceTracker::track(labels), OccurrenceTracker::track(labels));
}

TEST(OccurrenceTrackerTest, RunCounts) {
  auto keys =
      OccurrenceTracker::track(std::vector<std::string>{"C", "G", "C", "C", "G", "F", "C"});
  auto counts = OccurrenceTracker::runCounts(keys);
  EXPECT_EQ(counts["C"], 3);
  EXPECT_EQ(counts["G"], 2);
  EXPECT_EQ(counts["F"], 1);
  EXPECT_EQ(counts.count("Am"), 0u);
}

// ============================================================================
// shouldShowChordLabel
// ============================================================================

TEST(ShouldShowChordLabelTest, FirstCellOfEachRun) {
  std::vector<std::string> labels = {"C", "C", "G", "", "G", "G", "C"};
  EXPECT_TRUE(shouldShowChordLabel(0, labels));
  EXPECT_FALSE(shouldShowChordLabel(1, labels));
  EXPECT_TRUE(shouldShowChordLabel(2, labels));
  EXPECT_FALSE(shouldShowChordLabel(3, labels));
  EXPECT_TRUE(shouldShowChordLabel(4, labels));
  EXPECT_FALSE(shouldShowChordLabel(5, labels));
  EXPECT_TRUE(shouldShowChordLabel(6, labels));
}

TEST(ShouldShowChordLabelTest, RepeatedNoChordSuppressed) {
  std::vector<std::string> labels = {"G", "N.C.", "", "N.C.", "C", "N.C."};
  EXPECT_TRUE(shouldShowChordLabel(1, labels));
  EXPECT_FALSE(shouldShowChordLabel(3, labels));
  EXPECT_TRUE(shouldShowChordLabel(4, labels));
  EXPECT_TRUE(shouldShowChordLabel(5, labels));
}

TEST(ShouldShowChordLabelTest, OutOfRange) {
  std::vector<std::string> labels = {"C"};
  EXPECT_FALSE(shouldShowChordLabel(1, labels));
  EXPECT_FALSE(shouldShowChordLabel(0, {}));
}

}  // namespace
}  // namespace chordgrid
