// Tests for stats/distribution.h -- MetricDistribution profiles.

#include "stats/distribution.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

namespace dirstat {
namespace {

std::vector<double> range(int first, int last) {
  std::vector<double> values;
  for (int val = first; val <= last; ++val) values.push_back(val);
  return values;
}

// ---------------------------------------------------------------------------
// Edge cases
// ---------------------------------------------------------------------------

TEST(DistributionTest, EmptySampleIsAllZero) {
  MetricDistribution dist = MetricDistribution::fromValues({});
  EXPECT_EQ(dist.count, 0u);
  EXPECT_EQ(dist, MetricDistribution{});
}

TEST(DistributionTest, SingleValue) {
  MetricDistribution dist = MetricDistribution::fromValues({7.0});
  EXPECT_EQ(dist.count, 1u);
  for (double val : {dist.min, dist.max, dist.mean, dist.median, dist.p25, dist.p75,
                     dist.p90, dist.p95, dist.p99}) {
    EXPECT_DOUBLE_EQ(val, 7.0);
  }
  EXPECT_DOUBLE_EQ(dist.stddev, 0.0);
  EXPECT_DOUBLE_EQ(dist.skewness, 0.0);
  EXPECT_DOUBLE_EQ(dist.kurtosis, 0.0);
  EXPECT_DOUBLE_EQ(dist.cv, 0.0);
  EXPECT_DOUBLE_EQ(dist.iqr, 0.0);
  EXPECT_DOUBLE_EQ(dist.gini, 0.0);
  EXPECT_DOUBLE_EQ(dist.palma, 0.0);
  EXPECT_DOUBLE_EQ(dist.top_10_pct_share, 1.0);
  EXPECT_DOUBLE_EQ(dist.bottom_50_pct_share, 1.0);
}

TEST(DistributionTest, SmallSampleTailPercentilesFallBackToMax) {
  MetricDistribution dist = MetricDistribution::fromValues({3.0, 1.0, 2.0, 9.0});
  EXPECT_DOUBLE_EQ(dist.p90, 9.0);
  EXPECT_DOUBLE_EQ(dist.p95, 9.0);
  EXPECT_DOUBLE_EQ(dist.p99, 9.0);
}

TEST(DistributionTest, AllZeros) {
  MetricDistribution dist = MetricDistribution::fromValues(std::vector<double>(5, 0.0));
  EXPECT_EQ(dist.count, 5u);
  EXPECT_DOUBLE_EQ(dist.mean, 0.0);
  EXPECT_DOUBLE_EQ(dist.cv, 0.0);
  EXPECT_DOUBLE_EQ(dist.gini, 0.0);
  EXPECT_DOUBLE_EQ(dist.theil, 0.0);
  EXPECT_DOUBLE_EQ(dist.hoover, 0.0);
  EXPECT_DOUBLE_EQ(dist.palma, 0.0);
  EXPECT_DOUBLE_EQ(dist.top_10_pct_share, 0.0);
}

// ---------------------------------------------------------------------------
// Central tendency and percentiles
// ---------------------------------------------------------------------------

TEST(DistributionTest, FourValues) {
  MetricDistribution dist = MetricDistribution::fromValues({4.0, 1.0, 3.0, 2.0});
  EXPECT_DOUBLE_EQ(dist.min, 1.0);
  EXPECT_DOUBLE_EQ(dist.max, 4.0);
  EXPECT_DOUBLE_EQ(dist.mean, 2.5);
  EXPECT_DOUBLE_EQ(dist.median, 2.5);
  EXPECT_DOUBLE_EQ(dist.p25, 2.0);
  EXPECT_DOUBLE_EQ(dist.p75, 4.0);
  EXPECT_DOUBLE_EQ(dist.iqr, 2.0);
  EXPECT_NEAR(dist.stddev, std::sqrt(5.0 / 3.0), 1e-12);
  EXPECT_NEAR(dist.cv, std::sqrt(5.0 / 3.0) / 2.5, 1e-12);
  EXPECT_NEAR(dist.skewness, 0.0, 1e-12);
  EXPECT_NEAR(dist.kurtosis, -1.36, 1e-9);
}

TEST(DistributionTest, OddCountMedianIsMiddleValue) {
  MetricDistribution dist = MetricDistribution::fromValues({5.0, 1.0, 3.0});
  EXPECT_DOUBLE_EQ(dist.median, 3.0);
}

TEST(DistributionTest, HundredValuePercentiles) {
  MetricDistribution dist = MetricDistribution::fromValues(range(1, 100));
  EXPECT_DOUBLE_EQ(dist.median, 50.5);
  EXPECT_DOUBLE_EQ(dist.p25, 26.0);
  EXPECT_DOUBLE_EQ(dist.p75, 76.0);
  EXPECT_DOUBLE_EQ(dist.p90, 91.0);
  EXPECT_DOUBLE_EQ(dist.p95, 96.0);
  EXPECT_DOUBLE_EQ(dist.p99, 100.0);
}

TEST(DistributionTest, PercentilesAreOrdered) {
  std::mt19937 rng(1234);
  std::uniform_real_distribution<double> uniform(0.0, 1000.0);
  for (int size : {2, 3, 9, 10, 11, 57, 200}) {
    std::vector<double> values;
    for (int idx = 0; idx < size; ++idx) values.push_back(uniform(rng));
    MetricDistribution dist = MetricDistribution::fromValues(values);
    EXPECT_LE(dist.min, dist.p25) << size;
    EXPECT_LE(dist.p25, dist.median) << size;
    EXPECT_LE(dist.median, dist.p75) << size;
    EXPECT_LE(dist.p75, dist.p90) << size;
    EXPECT_LE(dist.p90, dist.p95) << size;
    EXPECT_LE(dist.p95, dist.p99) << size;
    EXPECT_LE(dist.p99, dist.max) << size;
    EXPECT_LE(dist.min, dist.mean) << size;
    EXPECT_LE(dist.mean, dist.max) << size;
  }
}

TEST(DistributionTest, ConstantSampleMeanStaysInBounds) {
  MetricDistribution dist = MetricDistribution::fromValues(std::vector<double>(7, 0.1));
  EXPECT_DOUBLE_EQ(dist.mean, 0.1);
  EXPECT_GE(dist.mean, dist.min);
  EXPECT_LE(dist.mean, dist.max);
}

// ---------------------------------------------------------------------------
// Inequality fields and determinism
// ---------------------------------------------------------------------------

TEST(DistributionTest, ConcentratedSample) {
  std::vector<double> values(9, 0.0);
  values.push_back(100.0);
  MetricDistribution dist = MetricDistribution::fromValues(values);
  EXPECT_GT(dist.gini, 0.8);
  EXPECT_TRUE(std::isinf(dist.palma));
  EXPECT_NEAR(dist.top_10_pct_share, 1.0, 1e-12);
  EXPECT_NEAR(dist.bottom_50_pct_share, 0.0, 1e-12);
  EXPECT_GT(dist.skewness, 0.0);
}

TEST(DistributionTest, ResultIndependentOfInputOrder) {
  std::vector<double> values = {0.1, 0.2, 0.3, 1e6, 7.0, 7.0, 3.3, 0.0, 12.5, 99.9, 0.7};
  MetricDistribution reference = MetricDistribution::fromValues(values);

  std::mt19937 rng(42);
  for (int round = 0; round < 10; ++round) {
    std::shuffle(values.begin(), values.end(), rng);
    EXPECT_EQ(MetricDistribution::fromValues(values), reference);
  }
}

TEST(DistributionTest, EqualityDetectsDifferences) {
  MetricDistribution lhs = MetricDistribution::fromValues({1.0, 2.0});
  MetricDistribution rhs = MetricDistribution::fromValues({1.0, 3.0});
  EXPECT_NE(lhs, rhs);
}

}  // namespace
}  // namespace dirstat
