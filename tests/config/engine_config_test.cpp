// Tests for config/engine_config.h -- configuration loading and validation.

#include "config/engine_config.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace dirstat {
namespace {

TEST(EngineConfigTest, Defaults) {
  EngineConfig config;
  EXPECT_TRUE(config.rollup.tracked_metrics.empty());
  EXPECT_EQ(config.rollup.loc_metric, "lines_code");
  EXPECT_EQ(config.rollup.strategy, RollupStrategy::BottomUp);
  EXPECT_EQ(config.presets.size(), 8u);
  EXPECT_EQ(config.classification.rules.size(), 5u);

  std::string error;
  EXPECT_TRUE(validateEngineConfig(config, &error)) << error;
}

TEST(EngineConfigTest, LoadsRollupOptions) {
  EngineConfig config;
  std::string error;
  ASSERT_TRUE(loadConfigFromJson(R"({
      "tracked_metrics": ["lines_code", "complexity"],
      "loc_metric": "lines_total",
      "strategy": "ancestor_closure",
      "unknown_key": 1
  })", config, &error)) << error;

  EXPECT_EQ(config.rollup.tracked_metrics,
            (std::vector<std::string>{"lines_code", "complexity"}));
  EXPECT_EQ(config.rollup.loc_metric, "lines_total");
  EXPECT_EQ(config.rollup.strategy, RollupStrategy::AncestorClosure);
  EXPECT_EQ(config.presets.size(), 8u);
}

TEST(EngineConfigTest, PresetsReplaceTable) {
  EngineConfig config;
  std::string error;
  ASSERT_TRUE(loadConfigFromJson(R"({
      "presets": [
        {"name": "team", "a": 2.5, "b": 1.1, "annual_wage": 90000, "overhead": 2.0},
        {"name": "volunteers", "annual_wage": 0}
      ]
  })", config, &error)) << error;

  ASSERT_EQ(config.presets.size(), 2u);
  EXPECT_EQ(config.presets[0].name, "team");
  EXPECT_DOUBLE_EQ(config.presets[0].a, 2.5);
  EXPECT_DOUBLE_EQ(config.presets[0].b, 1.1);
  EXPECT_DOUBLE_EQ(config.presets[0].monthlyWage(), 15000.0);
  // Unspecified coefficients keep the preset defaults.
  EXPECT_DOUBLE_EQ(config.presets[1].a, CocomoPreset{}.a);
  EXPECT_DOUBLE_EQ(config.presets[1].monthlyWage(), 0.0);
}

TEST(EngineConfigTest, StrategyAlias) {
  EngineConfig config;
  ASSERT_TRUE(loadConfigFromJson(R"({"strategy": "closure"})", config, nullptr));
  EXPECT_EQ(config.rollup.strategy, RollupStrategy::AncestorClosure);
}

TEST(EngineConfigTest, InvalidInputLeavesConfigUnchanged) {
  const char* inputs[] = {
      "[1, 2]",
      R"({"tracked_metrics": "lines_code"})",
      R"({"tracked_metrics": [1]})",
      R"({"loc_metric": 5})",
      R"({"loc_metric": ""})",
      R"({"strategy": "sideways"})",
      R"({"presets": {}})",
      R"({"presets": [{"a": 1}]})",
      R"({"presets": [{"name": "x", "a": "big"}]})",
      R"({"presets": [{"name": "x"}, {"name": "x"}]})",
      R"({"presets": [{"name": "x", "a": 0}]})",
      R"({"presets": [{"name": "x", "annual_wage": -1}]})",
      R"({"loc_metric": "lines_total", "strategy": 3})",
      "{not json",
  };
  for (const char* input : inputs) {
    EngineConfig config;
    std::string error;
    EXPECT_FALSE(loadConfigFromJson(input, config, &error)) << input;
    EXPECT_FALSE(error.empty()) << input;
    EXPECT_EQ(config.rollup.loc_metric, "lines_code") << input;
    EXPECT_EQ(config.rollup.strategy, RollupStrategy::BottomUp) << input;
    EXPECT_EQ(config.presets.size(), 8u) << input;
  }
}

TEST(EngineConfigTest, StrategyNames) {
  EXPECT_STREQ(rollupStrategyToString(RollupStrategy::BottomUp), "bottom_up");
  EXPECT_STREQ(rollupStrategyToString(RollupStrategy::AncestorClosure), "ancestor_closure");

  RollupStrategy strategy = RollupStrategy::AncestorClosure;
  EXPECT_TRUE(rollupStrategyFromString("bottom_up", strategy));
  EXPECT_EQ(strategy, RollupStrategy::BottomUp);
  EXPECT_FALSE(rollupStrategyFromString("top_down", strategy));
  EXPECT_EQ(strategy, RollupStrategy::BottomUp);
}

}  // namespace
}  // namespace dirstat
