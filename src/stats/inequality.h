// Inequality and shape measures over a sample of non-negative values.

#ifndef DIRSTAT_STATS_INEQUALITY_H
#define DIRSTAT_STATS_INEQUALITY_H

#include <vector>

namespace dirstat {
namespace stats {

// All functions take values sorted ascending. Callers sort once and share
// the sorted copy; summing in sorted order keeps results independent of
// the original input order.

/// @brief Sum of sorted values (ascending order summation).
double sortedSum(const std::vector<double>& sorted);

/// @brief Gini coefficient (0 = equality, towards 1 = concentration).
///
/// Mean absolute pairwise difference over 2 * mean, computed through the
/// rank form G = 2 * sum(i * x_i) / (n * sum) - (n + 1) / n.
/// @return 0 for n <= 1 or an all-zero sample.
double gini(const std::vector<double>& sorted);

/// @brief Theil T index: (1/n) * sum((x/mean) * ln(x/mean)).
///
/// Zero values contribute 0 to the sum (limit of x*ln(x)) but still count
/// towards n and the mean.
/// @return 0 for n <= 1, an all-zero sample or a uniform sample.
double theil(const std::vector<double>& sorted);

/// @brief Hoover index: 0.5 * sum(|x - mean|) / sum(x), in [0, 1].
/// @return 0 for n <= 1 or an all-zero sample.
double hoover(const std::vector<double>& sorted);

/// @brief Share of the total held by the largest `fraction` of values.
///
/// Uses max(1, floor(n * fraction)) values.
/// @return 0 for an empty or all-zero sample.
double topShare(const std::vector<double>& sorted, double fraction);

/// @brief Share of the total held by the smallest `fraction` of values.
/// @return 0 for an empty or all-zero sample.
double bottomShare(const std::vector<double>& sorted, double fraction);

/// @brief Palma ratio: top 10% sum over bottom 40% sum.
///
/// Top 10% = sorted[floor(0.9 n)..n), bottom 40% = sorted[0..floor(0.4 n)).
/// @return 0 for n < 4; +infinity when the bottom sum is 0 and the top sum
///         is positive; 0 when both are 0.
double palma(const std::vector<double>& sorted);

/// @brief Population skewness (third standardized moment).
/// @param stddev Population standard deviation of the sample.
/// @return 0 when n < 3 or stddev == 0.
double skewness(const std::vector<double>& sorted, double mean, double stddev);

/// @brief Population excess kurtosis (fourth standardized moment - 3).
/// @param stddev Population standard deviation of the sample.
/// @return 0 when n < 4 or stddev == 0.
double excessKurtosis(const std::vector<double>& sorted, double mean,
                      double stddev);

}  // namespace stats
}  // namespace dirstat

#endif  // DIRSTAT_STATS_INEQUALITY_H
