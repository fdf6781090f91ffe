/**
 * @file chord_beat_mapper_test.cpp
 * @brief Tests for segment selection and chord-to-beat mapping.
 */

#include "core/chord_beat_mapper.h"

#include <gtest/gtest.h>

#include "test_support/test_helpers.h"

namespace chordgrid {
namespace {

// ============================================================================
// segmentAt
// ============================================================================

TEST(SegmentAtTest, ContainingSegment) {
  std::vector<ChordSegment> segments = {{"C", 0.0, 2.0}, {"G", 2.0, 4.0}};
  EXPECT_EQ(segmentAt(segments, 0.0), 0u);
  EXPECT_EQ(segmentAt(segments, 1.99), 0u);
  EXPECT_EQ(segmentAt(segments, 2.0), 1u);  // end is exclusive
}

TEST(SegmentAtTest, ForwardFillAcrossGap) {
  std::vector<ChordSegment> segments = {{"C", 0.0, 1.0}, {"G", 3.0, 4.0}};
  int containing = -1;
  EXPECT_EQ(segmentAt(segments, 2.0, &containing), 0u);
  EXPECT_EQ(containing, 0);
  EXPECT_EQ(segmentAt(segments, 5.0), 1u);
}

TEST(SegmentAtTest, NothingStartedYet) {
  std::vector<ChordSegment> segments = {{"C", 1.0, 2.0}};
  EXPECT_FALSE(segmentAt(segments, 0.5).has_value());
  EXPECT_FALSE(segmentAt({}, 0.5).has_value());
}

TEST(SegmentAtTest, OverlapPrefersLaterStart) {
  std::vector<ChordSegment> segments = {{"C", 0.0, 4.0}, {"G", 1.0, 2.0}};
  int containing = 0;
  EXPECT_EQ(segmentAt(segments, 1.5, &containing), 1u);
  EXPECT_EQ(containing, 2);
  EXPECT_EQ(segmentAt(segments, 3.0, &containing), 0u);
  EXPECT_EQ(containing, 1);
}

TEST(SegmentAtTest, ContainingBeatsLaterForwardFill) {
  // G started later but has ended; C still contains t.
  std::vector<ChordSegment> segments = {{"C", 0.0, 4.0}, {"G", 1.0, 2.0}};
  EXPECT_EQ(segmentAt(segments, 2.5), 0u);
}

TEST(SegmentAtTest, EqualStartsUseLaterInput) {
  std::vector<ChordSegment> segments = {{"C", 0.0, 2.0}, {"D", 0.0, 2.0}};
  EXPECT_EQ(segmentAt(segments, 1.0), 1u);
}

TEST(SegmentAtTest, UnsortedInput) {
  std::vector<ChordSegment> segments = {{"G", 2.0, 4.0}, {"C", 0.0, 2.0}};
  EXPECT_EQ(segmentAt(segments, 1.0), 1u);
  EXPECT_EQ(segmentAt(segments, 3.0), 0u);
}

// ============================================================================
// ChordBeatMapper
// ============================================================================

TEST(ChordBeatMapperTest, MapsEveryBeat) {
  ChordNormalizer normalizer;
  ChordBeatMapper mapper(normalizer);
  auto segments = test::segmentsFor({{"C", 2}, {"Am7/G", 2}, {"F#:min", 2}});
  auto chords = mapper.mapTimes(test::evenBeats(6), segments);

  ASSERT_EQ(chords.size(), 6u);
  std::vector<std::string> expected = {"C", "C", "Am7", "Am7", "F#m", "F#m"};
  for (size_t i = 0; i < chords.size(); ++i) {
    ASSERT_TRUE(chords[i].has_value()) << i;
    EXPECT_EQ(chords[i]->display, expected[i]);
  }
}

TEST(ChordBeatMapperTest, NormalizesEachSegmentOnce) {
  ChordNormalizer normalizer;
  ChordBeatMapper mapper(normalizer);
  auto segments = test::segmentsFor({{"C", 4}, {"G", 4}});
  mapper.mapTimes(test::evenBeats(8), segments);
  EXPECT_EQ(normalizer.misses(), 2u);
  EXPECT_EQ(normalizer.hits(), 0u);
}

TEST(ChordBeatMapperTest, LeadingBeatsAreEmpty) {
  ChordNormalizer normalizer;
  ChordBeatMapper mapper(normalizer);
  auto segments = test::segmentsFor({{"C", 2}}, 1.0);
  auto chords = mapper.mapTimes(test::evenBeats(4), segments);
  EXPECT_FALSE(chords[0].has_value());
  EXPECT_FALSE(chords[1].has_value());
  EXPECT_TRUE(chords[2].has_value());
}

TEST(ChordBeatMapperTest, ChordPersistsUntilReplaced) {
  ChordNormalizer normalizer;
  ChordBeatMapper mapper(normalizer);
  std::vector<ChordSegment> segments = {{"C", 0.0, 0.6}, {"G", 2.0, 2.5}};
  auto chords = mapper.mapTimes(test::evenBeats(6), segments);
  std::vector<std::string> labels;
  for (const auto& chord : chords) labels.push_back(chord ? chord->display : "");
  EXPECT_EQ(labels, (std::vector<std::string>{"C", "C", "C", "C", "G", "G"}));
}

TEST(ChordBeatMapperTest, ExplicitNoChordSegmentIsEmpty) {
  ChordNormalizer normalizer;
  ChordBeatMapper mapper(normalizer);
  std::vector<Diagnostic> diagnostics;
  std::vector<ChordSegment> segments = {{"C", 0.0, 1.0}, {"N", 1.0, 1.5}};
  auto chords = mapper.mapTimes(test::evenBeats(5), segments, &diagnostics);
  EXPECT_TRUE(chords[1].has_value());
  EXPECT_FALSE(chords[2].has_value());
  EXPECT_FALSE(chords[4].has_value());  // forward-fills the no-chord segment
  EXPECT_TRUE(diagnostics.empty());
}

TEST(ChordBeatMapperTest, InvalidLabelDegradesToEmpty) {
  ChordNormalizer normalizer;
  ChordBeatMapper mapper(normalizer);
  std::vector<Diagnostic> diagnostics;
  auto segments = test::segmentsFor({{"C", 2}, {"H7", 2}, {"G", 2}});
  auto chords = mapper.mapTimes(test::evenBeats(6), segments, &diagnostics);

  EXPECT_TRUE(chords[1].has_value());
  EXPECT_FALSE(chords[2].has_value());
  EXPECT_FALSE(chords[3].has_value());
  EXPECT_EQ(chords[4]->display, "G");
  EXPECT_EQ(test::countDiagnostics(diagnostics, GridError::InvalidChordLabel), 1u);
}

TEST(ChordBeatMapperTest, OverlapIsReported) {
  ChordNormalizer normalizer;
  ChordBeatMapper mapper(normalizer);
  std::vector<Diagnostic> diagnostics;
  std::vector<ChordSegment> segments = {{"C", 0.0, 2.0}, {"Em", 0.9, 1.2}};
  auto chords = mapper.mapTimes(test::evenBeats(4), segments, &diagnostics);

  EXPECT_EQ(chords[2]->display, "Em");
  EXPECT_EQ(chords[3]->display, "C");
  ASSERT_EQ(test::countDiagnostics(diagnostics, GridError::AmbiguousSegmentOverlap), 1u);
  EXPECT_EQ(diagnostics[0].beat_index, 2);
}

TEST(ChordBeatMapperTest, AssembleCellsWithPadding) {
  ChordNormalizer normalizer;
  ChordBeatMapper mapper(normalizer);
  BeatGridOptions options;
  options.padding_count = 2;
  BeatGrid grid = BeatGridBuilder(options).build(test::evenBeats(4), {});
  auto cells = mapper.map(grid, test::segmentsFor({{"D", 4}}));

  ASSERT_EQ(cells.size(), 6u);
  for (size_t i = 0; i < cells.size(); ++i) {
    EXPECT_EQ(cells[i].beat_index, i);
    EXPECT_EQ(cells[i].beat_number, grid.frames[i].position_in_measure);
    EXPECT_EQ(cells[i].is_padding, i < 2);
  }
  EXPECT_FALSE(cells[0].chord.has_value());
  EXPECT_FALSE(cells[1].chord.has_value());
  EXPECT_FALSE(cells[0].timestamp.has_value());
  EXPECT_EQ(cells[2].display(), "D");
  EXPECT_DOUBLE_EQ(*cells[2].timestamp, 0.0);
  EXPECT_EQ(test::cellLabels(cells), (std::vector<std::string>{"", "", "D", "D", "D", "D"}));
}

}  // namespace
}  // namespace chordgrid
