// MetricDistribution computation.

#include "stats/distribution.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "stats/inequality.h"

namespace dirstat {
namespace {

/// @brief Integer-index percentile: sorted[floor(n * q)], clamped to the last element.
double indexPercentile(const std::vector<double>& sorted, double quantile) {
  auto idx = static_cast<size_t>(std::floor(static_cast<double>(sorted.size()) * quantile));
  if (idx >= sorted.size()) idx = sorted.size() - 1;
  return sorted[idx];
}

/// @brief Median of a sorted sample (mean of the middle pair for even n).
double sortedMedian(const std::vector<double>& sorted) {
  const size_t count = sorted.size();
  const size_t mid = count / 2;
  if (count % 2 == 1) return sorted[mid];
  return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

/// @brief Sum of squared deviations from the mean.
double squaredDeviation(const std::vector<double>& sorted, double mean) {
  double acc = 0.0;
  for (double val : sorted) {
    double dev = val - mean;
    acc += dev * dev;
  }
  return acc;
}

}  // namespace

MetricDistribution MetricDistribution::fromValues(std::vector<double> values) {
  MetricDistribution dist;
  if (values.empty()) return dist;

  std::sort(values.begin(), values.end());
  const std::vector<double>& sorted = values;
  const size_t count = sorted.size();
  const double num = static_cast<double>(count);

  dist.count = count;
  dist.min = sorted.front();
  dist.max = sorted.back();

  // Division can land one ulp outside [min, max] for constant samples.
  dist.mean = std::clamp(stats::sortedSum(sorted) / num, dist.min, dist.max);
  dist.median = sortedMedian(sorted);

  double sq_dev = squaredDeviation(sorted, dist.mean);
  dist.stddev = count > 1 ? std::sqrt(sq_dev / (num - 1.0)) : 0.0;
  double population_sd = std::sqrt(sq_dev / num);

  dist.p25 = indexPercentile(sorted, 0.25);
  dist.p75 = indexPercentile(sorted, 0.75);
  if (count < kTailPercentileMinCount) {
    dist.p90 = dist.max;
    dist.p95 = dist.max;
    dist.p99 = dist.max;
  } else {
    dist.p90 = indexPercentile(sorted, 0.90);
    dist.p95 = indexPercentile(sorted, 0.95);
    dist.p99 = indexPercentile(sorted, 0.99);
  }

  dist.skewness = stats::skewness(sorted, dist.mean, population_sd);
  dist.kurtosis = stats::excessKurtosis(sorted, dist.mean, population_sd);
  dist.cv = dist.mean != 0.0 ? dist.stddev / dist.mean : 0.0;
  dist.iqr = dist.p75 - dist.p25;

  dist.gini = stats::gini(sorted);
  dist.theil = stats::theil(sorted);
  dist.hoover = stats::hoover(sorted);
  dist.palma = stats::palma(sorted);
  dist.top_10_pct_share = stats::topShare(sorted, 0.10);
  dist.top_20_pct_share = stats::topShare(sorted, 0.20);
  dist.bottom_50_pct_share = stats::bottomShare(sorted, 0.50);

  return dist;
}

bool MetricDistribution::operator==(const MetricDistribution& other) const {
  // Palma may be infinite; == on doubles handles that, and NaN never occurs.
  return count == other.count && min == other.min && max == other.max &&
         mean == other.mean && median == other.median && stddev == other.stddev &&
         p25 == other.p25 && p75 == other.p75 && p90 == other.p90 &&
         p95 == other.p95 && p99 == other.p99 && skewness == other.skewness &&
         kurtosis == other.kurtosis && cv == other.cv && iqr == other.iqr &&
         gini == other.gini && theil == other.theil && hoover == other.hoover &&
         palma == other.palma && top_10_pct_share == other.top_10_pct_share &&
         top_20_pct_share == other.top_20_pct_share &&
         bottom_50_pct_share == other.bottom_50_pct_share;
}

}  // namespace dirstat
