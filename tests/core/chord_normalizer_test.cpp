/**
 * @file chord_normalizer_test.cpp
 * @brief Tests for chord label normalization and the memoizing normalizer.
 */

#include "core/chord_normalizer.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>
#include <vector>

namespace chordgrid {
namespace {

NormalizedChord mustNormalize(const std::string& label) {
  NormalizeResult result = normalizeChordLabel(label);
  EXPECT_EQ(result.status, LabelStatus::Chord) << label;
  return result.chord.value_or(NormalizedChord{});
}

// ============================================================================
// Suffix preservation
// ============================================================================

TEST(ChordNormalizerTest, MinorSeventhNeverCollapsesToMajor) {
  for (const char* label : {"Fm7", "Cm7", "Am7", "Em7", "Dm7", "Gm7"}) {
    NormalizedChord chord = mustNormalize(label);
    EXPECT_EQ(chord.suffix, "m7") << label;
    EXPECT_EQ(chord.display, label) << label;
  }
}

TEST(ChordNormalizerTest, MajorAndMinorControls) {
  EXPECT_EQ(mustNormalize("F").suffix, "");
  EXPECT_EQ(mustNormalize("Fm").suffix, "m");
  EXPECT_EQ(mustNormalize("F").display, "F");
  EXPECT_EQ(mustNormalize("Fm").display, "Fm");
}

TEST(ChordNormalizerTest, UnknownSuffixIsKeptVerbatim) {
  NormalizedChord chord = mustNormalize("C7b9#11");
  EXPECT_EQ(chord.suffix, "7b9#11");
  EXPECT_NE(chord.suffix, "");
  EXPECT_FALSE(isKnownSuffix("7b9#11"));
}

TEST(ChordNormalizerTest, QualityAliasesResolve) {
  EXPECT_EQ(mustNormalize("Cmin7").suffix, "m7");
  EXPECT_EQ(mustNormalize("C-7").suffix, "m7");
  EXPECT_EQ(mustNormalize("CM7").suffix, "maj7");
  EXPECT_EQ(mustNormalize("Cmaj7").suffix, "maj7");
  EXPECT_EQ(mustNormalize("CMaj7").suffix, "maj7");
  EXPECT_EQ(mustNormalize("Cmaj").suffix, "");
  EXPECT_EQ(mustNormalize("Chdim7").suffix, "m7b5");
  EXPECT_EQ(mustNormalize("Cdim").suffix, "dim");
  EXPECT_EQ(mustNormalize("C+").suffix, "aug");
  EXPECT_EQ(mustNormalize("Csus").suffix, "sus4");
  EXPECT_EQ(mustNormalize("CmM7").suffix, "mmaj7");
}

TEST(ChordNormalizerTest, CaseOfQualityLetterMatters) {
  EXPECT_EQ(mustNormalize("CM7").suffix, "maj7");
  EXPECT_EQ(mustNormalize("Cm7").suffix, "m7");
}

// ============================================================================
// Harte notation and roots
// ============================================================================

TEST(ChordNormalizerTest, HarteNotation) {
  EXPECT_EQ(mustNormalize("F#:min7").display, "F#m7");
  EXPECT_EQ(mustNormalize("A:maj").display, "A");
  EXPECT_EQ(mustNormalize("Bb:hdim7").display, "Bbm7b5");
  EXPECT_EQ(mustNormalize("G:7").display, "G7");
}

TEST(ChordNormalizerTest, EnharmonicSpellingsShareDisplay) {
  EXPECT_EQ(mustNormalize("G#").display, mustNormalize("Ab").display);
  EXPECT_EQ(mustNormalize("Db:min").display, mustNormalize("C#m").display);
  EXPECT_EQ(mustNormalize("D#m7").display, "Ebm7");
  EXPECT_EQ(mustNormalize("A#").display, "Bb");
  EXPECT_EQ(mustNormalize("Gb").display, "F#");
  EXPECT_EQ(mustNormalize("Fb").display, "E");
  EXPECT_EQ(mustNormalize("Cb").display, "B");
}

TEST(ChordNormalizerTest, UnicodeAccidentalsAndCase) {
  EXPECT_EQ(mustNormalize("F\xE2\x99\xAF" "m7").display, "F#m7");
  EXPECT_EQ(mustNormalize("B\xE2\x99\xAD").display, "Bb");
  EXPECT_EQ(mustNormalize("ab").display, "Ab");
  EXPECT_EQ(mustNormalize("  Em  ").display, "Em");
}

TEST(ChordNormalizerTest, PitchClassParsing) {
  EXPECT_EQ(parsePitchClass("C"), 0);
  EXPECT_EQ(parsePitchClass("B#"), 0);
  EXPECT_EQ(parsePitchClass("Ebb"), 2);
  EXPECT_EQ(parsePitchClass("g#"), 8);
  EXPECT_FALSE(parsePitchClass("H").has_value());
  EXPECT_FALSE(parsePitchClass("C#m").has_value());
  EXPECT_FALSE(parsePitchClass("").has_value());
  EXPECT_STREQ(pitchClassName(13), "C#");
  EXPECT_STREQ(pitchClassName(-1), "B");
}

// ============================================================================
// Inversions
// ============================================================================

TEST(ChordNormalizerTest, InversionStripping) {
  EXPECT_EQ(mustNormalize("Ab/C").display, mustNormalize("Ab").display);
  EXPECT_EQ(mustNormalize("F/A").display, "F");
  EXPECT_EQ(mustNormalize("C/E").display, "C");
  EXPECT_EQ(mustNormalize("Dm7/F").display, "Dm7");
  EXPECT_EQ(mustNormalize("C:maj/3").display, "C");
}

TEST(ChordNormalizerTest, LabelsWithoutSlashUnchanged) {
  EXPECT_EQ(mustNormalize("G").display, "G");
  EXPECT_EQ(mustNormalize("Am").display, "Am");
}

TEST(ChordNormalizerTest, DeduplicationAfterNormalization) {
  std::vector<std::string> raw = {"Ab", "Ab/C", "C",  "F",   "Fm7",
                                  "Fm7/Ab", "G", "Ab", "C/E", "F"};
  std::set<std::string> distinct;
  for (const auto& label : raw) distinct.insert(mustNormalize(label).display);

  std::vector<std::string> sorted(distinct.begin(), distinct.end());
  std::vector<std::string> expected = {"Ab", "C", "F", "Fm7", "G"};
  EXPECT_EQ(sorted, expected);
}

// ============================================================================
// No-chord and invalid labels
// ============================================================================

TEST(ChordNormalizerTest, NoChordLabels) {
  for (const char* label : {"", "N", "N.C.", "n/c", "NC", "X", "  "}) {
    NormalizeResult result = normalizeChordLabel(label);
    EXPECT_EQ(result.status, LabelStatus::NoChord) << "'" << label << "'";
    EXPECT_FALSE(result.chord.has_value());
  }
}

TEST(ChordNormalizerTest, InvalidRootIsRejected) {
  for (const char* label : {"H7", "Q", "7", "#m", "Xm:min"}) {
    NormalizeResult result = normalizeChordLabel(label);
    EXPECT_EQ(result.status, LabelStatus::Invalid) << label;
    EXPECT_FALSE(result.chord.has_value());
  }
}

TEST(ChordNormalizerTest, HarteRootMustBeFullyConsumed) {
  EXPECT_EQ(normalizeChordLabel("Cx:maj").status, LabelStatus::Invalid);
}

// ============================================================================
// Simplification
// ============================================================================

TEST(ChordSimplifyTest, FiveFamilies) {
  EXPECT_EQ(simplifySuffix(""), "");
  EXPECT_EQ(simplifySuffix("maj7"), "");
  EXPECT_EQ(simplifySuffix("7"), "");
  EXPECT_EQ(simplifySuffix("m7"), "m");
  EXPECT_EQ(simplifySuffix("mmaj7"), "m");
  EXPECT_EQ(simplifySuffix("m7b5"), "dim");
  EXPECT_EQ(simplifySuffix("dim7"), "dim");
  EXPECT_EQ(simplifySuffix("aug7"), "aug");
  EXPECT_EQ(simplifySuffix("sus4"), "sus");
  EXPECT_EQ(simplifySuffix("7sus4"), "sus");
}

TEST(ChordSimplifyTest, SimplifyLabel) {
  EXPECT_EQ(simplifyLabel("Dm7/F"), "Dm");
  EXPECT_EQ(simplifyLabel("F#:min7"), "F#m");
  EXPECT_EQ(simplifyLabel("Cmaj7"), "C");
  EXPECT_EQ(simplifyLabel("N.C."), "N.C.");
  EXPECT_EQ(simplifyLabel("H7"), "H7");
}

TEST(ChordSimplifyTest, SimplifyChordKeepsRoot) {
  NormalizedChord simple = simplifyChord(mustNormalize("Bbm7b5"));
  EXPECT_EQ(simple.root, "Bb");
  EXPECT_EQ(simple.pitch_class, 10);
  EXPECT_EQ(simple.display, "Bbdim");
}

// ============================================================================
// Transposition
// ============================================================================

TEST(ChordTransposeTest, KeySpelling) {
  EXPECT_TRUE(usesFlatSpelling("F"));
  EXPECT_TRUE(usesFlatSpelling("Db major"));
  EXPECT_TRUE(usesFlatSpelling("Bbm"));
  EXPECT_FALSE(usesFlatSpelling("G major"));
  EXPECT_FALSE(usesFlatSpelling("b minor"));
  EXPECT_FALSE(usesFlatSpelling(""));
}

TEST(ChordTransposeTest, TargetKeyKeepsPreference) {
  EXPECT_EQ(transposeKey("Db major", 2), "Eb major");
  EXPECT_EQ(transposeKey("A minor", 1), "A# minor");
  EXPECT_EQ(transposeKey("F", 1), "Gb");
  EXPECT_EQ(transposeKey("F#m", -1), "Fm");
  EXPECT_EQ(transposeKey("C major", 0), "C major");
  EXPECT_EQ(transposeKey("unknown", 3), "unknown");
}

TEST(ChordTransposeTest, RootMovesSuffixKept) {
  NormalizedChord am7 = mustNormalize("A:min7");
  NormalizedChord up = transposeChord(am7, 1, "A# minor");
  EXPECT_EQ(up.root, "A#");
  EXPECT_EQ(up.pitch_class, 10);
  EXPECT_EQ(up.suffix, "m7");
  EXPECT_EQ(up.display, "A#m7");

  EXPECT_EQ(transposeChord(am7, 1, "Bb major").display, "Bbm7");
  EXPECT_EQ(transposeChord(mustNormalize("C"), -3, "").display, "A");
  EXPECT_EQ(transposeChord(am7, 0, "Bb major"), am7);
}

TEST(ChordTransposeTest, RangeIsClamped) {
  NormalizedChord c = mustNormalize("C");
  EXPECT_EQ(transposeChord(c, 11, "").display, transposeChord(c, 6, "").display);
  EXPECT_EQ(transposeChord(c, -20, "").display, "F#");
  EXPECT_EQ(transposeLabel("C", 9, "Gb major"), "Gb");
}

TEST(ChordTransposeTest, LabelsWithBass) {
  EXPECT_EQ(transposeLabel("Dm7/F", 2, "E major"), "Em7/G");
  EXPECT_EQ(transposeLabel("C/E", -2, "Bb major"), "Bb/D");
  EXPECT_EQ(transposeLabel("C/5", 2, "D major"), "D/5");
  EXPECT_EQ(transposeLabel("G:sus4", 2, ""), "A:sus4");
}

TEST(ChordTransposeTest, NoChordAndUnparsedLabelsUnchanged) {
  EXPECT_EQ(transposeLabel(NO_CHORD_LABEL, 3, "C major"), NO_CHORD_LABEL);
  EXPECT_EQ(transposeLabel("", 3, "C major"), "");
  EXPECT_EQ(transposeLabel("?", 3, "C major"), "?");
}

// ============================================================================
// Memoizing normalizer
// ============================================================================

TEST(ChordNormalizerCacheTest, MatchesPureFunction) {
  ChordNormalizer normalizer;
  for (const char* label : {"Fm7", "Ab/C", "N", "H7", "F#:min7", "Fm7"}) {
    NormalizeResult cached = normalizer.normalize(label);
    NormalizeResult pure = normalizeChordLabel(label);
    EXPECT_EQ(cached.status, pure.status) << label;
    EXPECT_EQ(cached.chord, pure.chord) << label;
  }
}

TEST(ChordNormalizerCacheTest, RepeatedCallsHitCache) {
  ChordNormalizer normalizer;
  NormalizeResult first = normalizer.normalize("Gm7");
  NormalizeResult second = normalizer.normalize("Gm7");
  EXPECT_EQ(first.chord, second.chord);
  EXPECT_EQ(normalizer.misses(), 1u);
  EXPECT_EQ(normalizer.hits(), 1u);
  EXPECT_EQ(normalizer.size(), 1u);
}

TEST(ChordNormalizerCacheTest, EvictsLeastRecentlyUsed) {
  ChordNormalizer normalizer(2);
  normalizer.normalize("C");
  normalizer.normalize("G");
  normalizer.normalize("C");   // C is now most recent
  normalizer.normalize("Am");  // evicts G
  EXPECT_EQ(normalizer.size(), 2u);

  size_t misses = normalizer.misses();
  normalizer.normalize("C");
  EXPECT_EQ(normalizer.misses(), misses);
  normalizer.normalize("G");
  EXPECT_EQ(normalizer.misses(), misses + 1);
}

TEST(ChordNormalizerCacheTest, ZeroCapacityDisablesCaching) {
  ChordNormalizer normalizer(0);
  normalizer.normalize("C");
  normalizer.normalize("C");
  EXPECT_EQ(normalizer.size(), 0u);
  EXPECT_EQ(normalizer.misses(), 2u);
  EXPECT_EQ(normalizer.normalize("C").chord->display, "C");
}

TEST(ChordNormalizerCacheTest, ClearResetsState) {
  ChordNormalizer normalizer;
  normalizer.normalize("C");
  normalizer.normalize("C");
  normalizer.clear();
  EXPECT_EQ(normalizer.size(), 0u);
  EXPECT_EQ(normalizer.hits(), 0u);
  EXPECT_EQ(normalizer.misses(), 0u);
}

}  // namespace
}  // namespace chordgrid
