// Statistical distribution profile of one metric over a set of files.

#ifndef DIRSTAT_STATS_DISTRIBUTION_H
#define DIRSTAT_STATS_DISTRIBUTION_H

#include <cstdint>
#include <vector>

namespace dirstat {

/// Sample size below which p90/p95/p99 fall back to the maximum.
constexpr uint64_t kTailPercentileMinCount = 10;

/// @brief Distribution statistics for one metric in one scope.
///
/// A pure function of the value multiset: the same values in any order
/// produce a bitwise-identical result. All fields are zero for an empty
/// sample.
struct MetricDistribution {
  uint64_t count = 0;

  // Central tendency and spread.
  double min = 0.0;
  double max = 0.0;
  double mean = 0.0;
  double median = 0.0;
  double stddev = 0.0;  ///< Sample standard deviation (n - 1 denominator).

  // Percentiles, sorted[floor(n * q)].
  double p25 = 0.0;
  double p75 = 0.0;
  double p90 = 0.0;
  double p95 = 0.0;
  double p99 = 0.0;

  // Shape.
  double skewness = 0.0;
  double kurtosis = 0.0;  ///< Excess kurtosis.
  double cv = 0.0;        ///< stddev / mean.
  double iqr = 0.0;       ///< p75 - p25.

  // Inequality.
  double gini = 0.0;
  double theil = 0.0;
  double hoover = 0.0;
  double palma = 0.0;  ///< May be +infinity, see stats::palma().
  double top_10_pct_share = 0.0;
  double top_20_pct_share = 0.0;
  double bottom_50_pct_share = 0.0;

  /// @brief Compute the full profile from raw values.
  /// @param values Sample in any order (copied and sorted internally).
  static MetricDistribution fromValues(std::vector<double> values);

  bool operator==(const MetricDistribution& other) const;
  bool operator!=(const MetricDistribution& other) const { return !(*this == other); }
};

}  // namespace dirstat

#endif  // DIRSTAT_STATS_DISTRIBUTION_H
