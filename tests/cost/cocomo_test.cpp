// Tests for cost/cocomo.h -- COCOMO effort and cost estimation.

#include "cost/cocomo.h"

#include <gtest/gtest.h>

#include <cmath>
#include <string>

namespace dirstat {
namespace {

const CocomoPreset& preset(const std::string& name) {
  static const CocomoPresetTable table = defaultCocomoPresets();
  const CocomoPreset* found = findPreset(table, name);
  EXPECT_NE(found, nullptr) << name;
  return found ? *found : table.front();
}

// ---------------------------------------------------------------------------
// Preset table
// ---------------------------------------------------------------------------

TEST(CocomoTest, DefaultTableOrder) {
  CocomoPresetTable table = defaultCocomoPresets();
  const char* expected[] = {"early_startup", "growth_startup", "scale_up",
                            "sme",           "mid_market",     "large_enterprise",
                            "regulated",     "open_source"};
  ASSERT_EQ(table.size(), 8u);
  for (size_t idx = 0; idx < table.size(); ++idx) {
    EXPECT_EQ(table[idx].name, expected[idx]);
    EXPECT_FALSE(table[idx].description.empty());
  }
}

TEST(CocomoTest, FindPresetMissing) {
  CocomoPresetTable table = defaultCocomoPresets();
  EXPECT_EQ(findPreset(table, "nonexistent"), nullptr);
}

TEST(CocomoTest, MonthlyWage) {
  EXPECT_DOUBLE_EQ(preset("early_startup").monthlyWage(), 150000.0 / 12.0 * 1.5);
  EXPECT_DOUBLE_EQ(preset("open_source").monthlyWage(), 0.0);
}

// ---------------------------------------------------------------------------
// Estimates
// ---------------------------------------------------------------------------

TEST(CocomoTest, ZeroKlocIsAllZero) {
  for (const auto& entry : defaultCocomoPresets()) {
    CocomoEstimate estimate = estimateCocomo(0.0, entry);
    EXPECT_DOUBLE_EQ(estimate.effort_person_months, 0.0) << entry.name;
    EXPECT_DOUBLE_EQ(estimate.schedule_months, 0.0) << entry.name;
    EXPECT_DOUBLE_EQ(estimate.people, 0.0) << entry.name;
    EXPECT_DOUBLE_EQ(estimate.cost, 0.0) << entry.name;
  }
  CocomoEstimate negative = estimateCocomo(-3.0, preset("sme"));
  EXPECT_DOUBLE_EQ(negative.effort_person_months, 0.0);
}

TEST(CocomoTest, EarlyStartupAtTenKloc) {
  CocomoEstimate estimate = estimateCocomo(10.0, preset("early_startup"));
  // effort = 2.0 * 10^1.0 * 0.8
  EXPECT_NEAR(estimate.effort_person_months, 16.0, 1e-9);
  EXPECT_NEAR(estimate.schedule_months, 2.2 * std::pow(16.0, 0.40), 1e-9);
  EXPECT_NEAR(estimate.people, 16.0 / estimate.schedule_months, 1e-9);
  EXPECT_NEAR(estimate.cost, 16.0 * 18750.0, 1e-6);
}

TEST(CocomoTest, OpenSourceHasEffortButNoCost) {
  CocomoEstimate estimate = estimateCocomo(25.0, preset("open_source"));
  EXPECT_GT(estimate.effort_person_months, 0.0);
  EXPECT_GT(estimate.schedule_months, 0.0);
  EXPECT_DOUBLE_EQ(estimate.cost, 0.0);
}

TEST(CocomoTest, LargeEnterpriseCostsMoreThanEarlyStartup) {
  for (double kloc : {1.0, 10.0, 100.0, 1000.0}) {
    EXPECT_GT(estimateCocomo(kloc, preset("large_enterprise")).cost,
              estimateCocomo(kloc, preset("early_startup")).cost)
        << kloc;
  }
}

TEST(CocomoTest, CostGrowsWithSize) {
  const CocomoPreset& sme = preset("sme");
  double previous = 0.0;
  for (double kloc : {0.5, 1.0, 5.0, 50.0, 500.0}) {
    double cost = estimateCocomo(kloc, sme).cost;
    EXPECT_GT(cost, previous) << kloc;
    previous = cost;
  }
}

TEST(CocomoTest, EstimateAllKeepsTableOrder) {
  CocomoPresetTable table = defaultCocomoPresets();
  auto estimates = estimateAll(12.5, table);
  ASSERT_EQ(estimates.size(), table.size());
  for (size_t idx = 0; idx < table.size(); ++idx) {
    EXPECT_EQ(estimates[idx].first, table[idx].name);
    EXPECT_DOUBLE_EQ(estimates[idx].second.cost, estimateCocomo(12.5, table[idx]).cost);
  }
}

}  // namespace
}  // namespace dirstat
