// Tests for stats/inequality.h -- concentration and shape measures.

#include "stats/inequality.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

namespace dirstat {
namespace {

std::vector<double> oneHeavyFile() {
  std::vector<double> values(9, 0.0);
  values.push_back(100.0);
  return values;
}

std::vector<double> oneToTen() {
  std::vector<double> values;
  for (int val = 1; val <= 10; ++val) values.push_back(val);
  return values;
}

// ---------------------------------------------------------------------------
// Gini
// ---------------------------------------------------------------------------

TEST(InequalityTest, GiniOfEqualValuesIsZero) {
  EXPECT_NEAR(stats::gini({10.0, 10.0, 10.0, 10.0}), 0.0, 1e-12);
}

TEST(InequalityTest, GiniOfConcentratedValuesIsHigh) {
  double value = stats::gini(oneHeavyFile());
  EXPECT_GT(value, 0.8);
  EXPECT_NEAR(value, 0.9, 1e-12);
}

TEST(InequalityTest, GiniDegenerateInputs) {
  EXPECT_DOUBLE_EQ(stats::gini({}), 0.0);
  EXPECT_DOUBLE_EQ(stats::gini({42.0}), 0.0);
  EXPECT_DOUBLE_EQ(stats::gini({0.0, 0.0, 0.0}), 0.0);
}

// ---------------------------------------------------------------------------
// Theil / Hoover
// ---------------------------------------------------------------------------

TEST(InequalityTest, TheilOfEqualValuesIsZero) {
  EXPECT_NEAR(stats::theil({3.0, 3.0, 3.0}), 0.0, 1e-12);
}

TEST(InequalityTest, TheilZerosContributeNothingButCount) {
  // Mean is 2.5 over all four values; only the two fives contribute.
  EXPECT_NEAR(stats::theil({0.0, 0.0, 5.0, 5.0}), std::log(2.0), 1e-12);
  EXPECT_NEAR(stats::theil(oneHeavyFile()), std::log(10.0), 1e-12);
}

TEST(InequalityTest, HooverMeasuresRedistributionShare) {
  EXPECT_NEAR(stats::hoover({10.0, 10.0}), 0.0, 1e-12);
  EXPECT_NEAR(stats::hoover(oneHeavyFile()), 0.9, 1e-12);
  EXPECT_DOUBLE_EQ(stats::hoover({5.0}), 0.0);
  EXPECT_DOUBLE_EQ(stats::hoover({0.0, 0.0}), 0.0);
}

// ---------------------------------------------------------------------------
// Shares
// ---------------------------------------------------------------------------

TEST(InequalityTest, TopShareOfUniformValues) {
  std::vector<double> uniform(10, 5.0);
  EXPECT_NEAR(stats::topShare(uniform, 0.10), 0.1, 1e-12);
  EXPECT_NEAR(stats::topShare(uniform, 0.20), 0.2, 1e-12);
  EXPECT_NEAR(stats::bottomShare(uniform, 0.50), 0.5, 1e-12);
}

TEST(InequalityTest, SharesUseAtLeastOneValue) {
  // floor(3 * 0.1) is 0, so the single largest value is used.
  EXPECT_NEAR(stats::topShare({1.0, 1.0, 2.0}, 0.10), 0.5, 1e-12);
  EXPECT_NEAR(stats::bottomShare({1.0, 1.0, 2.0}, 0.10), 0.25, 1e-12);
}

TEST(InequalityTest, BottomHalfOfOneToTen) {
  EXPECT_NEAR(stats::bottomShare(oneToTen(), 0.50), 15.0 / 55.0, 1e-12);
  EXPECT_NEAR(stats::topShare(oneToTen(), 0.20), 19.0 / 55.0, 1e-12);
}

TEST(InequalityTest, SharesOfZeroTotalAreZero) {
  EXPECT_DOUBLE_EQ(stats::topShare({0.0, 0.0}, 0.10), 0.0);
  EXPECT_DOUBLE_EQ(stats::bottomShare({}, 0.50), 0.0);
}

// ---------------------------------------------------------------------------
// Palma
// ---------------------------------------------------------------------------

TEST(InequalityTest, PalmaNeedsFourValues) {
  EXPECT_DOUBLE_EQ(stats::palma({1.0, 2.0, 3.0}), 0.0);
}

TEST(InequalityTest, PalmaIsInfiniteWhenBottomIsEmpty) {
  double value = stats::palma(oneHeavyFile());
  EXPECT_TRUE(std::isinf(value));
  EXPECT_GT(value, 0.0);
}

TEST(InequalityTest, PalmaOfAllZerosIsZero) {
  EXPECT_DOUBLE_EQ(stats::palma(std::vector<double>(10, 0.0)), 0.0);
}

TEST(InequalityTest, PalmaRatioOfTopTenthToBottomForty) {
  // Bottom slice [0, 4) = 1+2+3+4, top slice [9, 10) = 10.
  EXPECT_NEAR(stats::palma(oneToTen()), 1.0, 1e-12);
}

// ---------------------------------------------------------------------------
// Shape
// ---------------------------------------------------------------------------

TEST(InequalityTest, SkewnessOfSymmetricSampleIsZero) {
  EXPECT_NEAR(stats::skewness({1.0, 2.0, 3.0}, 2.0, std::sqrt(2.0 / 3.0)), 0.0, 1e-12);
}

TEST(InequalityTest, SkewnessSignFollowsTail) {
  std::vector<double> right_tail = {1.0, 1.0, 1.0, 10.0};
  double mean = 13.0 / 4.0;
  double pop_sd = std::sqrt((3 * 2.25 * 2.25 + 6.75 * 6.75) / 4.0);
  EXPECT_GT(stats::skewness(right_tail, mean, pop_sd), 0.0);
}

TEST(InequalityTest, ShapeGuards) {
  EXPECT_DOUBLE_EQ(stats::skewness({1.0, 2.0}, 1.5, 0.5), 0.0);
  EXPECT_DOUBLE_EQ(stats::skewness({2.0, 2.0, 2.0}, 2.0, 0.0), 0.0);
  EXPECT_DOUBLE_EQ(stats::excessKurtosis({1.0, 2.0, 3.0}, 2.0, 1.0), 0.0);
}

TEST(InequalityTest, ExcessKurtosisOfFourPoints) {
  // Deviations +-1.5, +-0.5: fourth moment 10.25 / 4, variance 1.25.
  EXPECT_NEAR(stats::excessKurtosis({1.0, 2.0, 3.0, 4.0}, 2.5, std::sqrt(1.25)),
              10.25 / (4.0 * 1.5625) - 3.0, 1e-9);
}

}  // namespace
}  // namespace dirstat
