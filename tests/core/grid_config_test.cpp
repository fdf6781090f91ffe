/**
 * @file grid_config_test.cpp
 * @brief Tests for GridConfig defaults and JSON loading.
 */

#include "core/grid_config.h"

#include <gtest/gtest.h>

namespace chordgrid {
namespace {

TEST(GridConfigTest, Defaults) {
  GridConfig config;
  EXPECT_EQ(config.beats_per_measure, 4);
  EXPECT_TRUE(config.auto_align);
  EXPECT_FALSE(config.simplify_chords);
  EXPECT_TRUE(config.show_corrected);
  EXPECT_EQ(config.normalizer_cache_capacity, 256u);
  EXPECT_FALSE(config.verbose);
}

TEST(GridConfigTest, JsonRoundTrip) {
  GridConfig config;
  config.beats_per_measure = 3;
  config.auto_align = false;
  config.simplify_chords = true;
  config.show_corrected = false;
  config.normalizer_cache_capacity = 0;
  config.verbose = true;

  GridConfig loaded = GridConfig::fromJson(config.toJson());
  EXPECT_EQ(loaded.beats_per_measure, 3);
  EXPECT_FALSE(loaded.auto_align);
  EXPECT_TRUE(loaded.simplify_chords);
  EXPECT_FALSE(loaded.show_corrected);
  EXPECT_EQ(loaded.normalizer_cache_capacity, 0u);
  EXPECT_TRUE(loaded.verbose);
}

TEST(GridConfigTest, CompactOutput) {
  std::string json = GridConfig().toJson(false);
  EXPECT_EQ(json.find('\n'), std::string::npos);
  EXPECT_NE(json.find("\"beats_per_measure\":4"), std::string::npos);
  EXPECT_NE(json.find("\"auto_align\":true"), std::string::npos);
}

TEST(GridConfigTest, MissingKeysKeepDefaults) {
  GridConfig loaded = GridConfig::fromJson(R"({"beats_per_measure": 6, "unknown": "x"})");
  EXPECT_EQ(loaded.beats_per_measure, 6);
  EXPECT_TRUE(loaded.auto_align);
  EXPECT_TRUE(loaded.show_corrected);
  EXPECT_EQ(loaded.normalizer_cache_capacity, 256u);
}

TEST(GridConfigTest, MalformedJsonGivesDefaults) {
  GridConfig loaded = GridConfig::fromJson("not json");
  EXPECT_EQ(loaded.beats_per_measure, 4);
  EXPECT_TRUE(loaded.auto_align);
}

TEST(GridConfigTest, WrongTypesKeepDefaults) {
  GridConfig loaded = GridConfig::fromJson(R"({"beats_per_measure": "three", "verbose": 1})");
  EXPECT_EQ(loaded.beats_per_measure, 4);
  EXPECT_FALSE(loaded.verbose);
}

}  // namespace
}  // namespace chordgrid
