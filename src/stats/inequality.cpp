// Inequality and shape measures.

#include "stats/inequality.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>

namespace dirstat {
namespace stats {
namespace {

/// Minimum sample size for the Palma decile split.
constexpr size_t kPalmaMinCount = 4;

/// @brief Clamp to [0, 1], absorbing rounding residue around the bounds.
double clampUnit(double val) {
  if (val < 0.0) return 0.0;
  if (val > 1.0) return 1.0;
  return val;
}

/// @brief Number of elements making up a `fraction` slice (at least one).
size_t sliceCount(size_t count, double fraction) {
  auto slice = static_cast<size_t>(std::floor(static_cast<double>(count) * fraction));
  return std::max<size_t>(1, std::min(slice, count));
}

}  // namespace

double sortedSum(const std::vector<double>& sorted) {
  double total = 0.0;
  for (double val : sorted) total += val;
  return total;
}

double gini(const std::vector<double>& sorted) {
  const size_t count = sorted.size();
  if (count < 2) return 0.0;

  double total = sortedSum(sorted);
  if (total <= 0.0) return 0.0;

  double weighted = 0.0;
  for (size_t idx = 0; idx < count; ++idx) {
    weighted += static_cast<double>(idx + 1) * sorted[idx];
  }
  const double num = static_cast<double>(count);
  return clampUnit(2.0 * weighted / (num * total) - (num + 1.0) / num);
}

double theil(const std::vector<double>& sorted) {
  const size_t count = sorted.size();
  if (count < 2) return 0.0;

  double total = sortedSum(sorted);
  if (total <= 0.0) return 0.0;

  const double mean = total / static_cast<double>(count);
  double acc = 0.0;
  for (double val : sorted) {
    if (val <= 0.0) continue;  // lim x->0 of x*ln(x) is 0
    double ratio = val / mean;
    acc += ratio * std::log(ratio);
  }
  return std::max(0.0, acc / static_cast<double>(count));
}

double hoover(const std::vector<double>& sorted) {
  const size_t count = sorted.size();
  if (count < 2) return 0.0;

  double total = sortedSum(sorted);
  if (total <= 0.0) return 0.0;

  const double mean = total / static_cast<double>(count);
  double deviation = 0.0;
  for (double val : sorted) deviation += std::fabs(val - mean);
  return clampUnit(0.5 * deviation / total);
}

double topShare(const std::vector<double>& sorted, double fraction) {
  if (sorted.empty()) return 0.0;
  double total = sortedSum(sorted);
  if (total <= 0.0) return 0.0;

  size_t take = sliceCount(sorted.size(), fraction);
  double top = 0.0;
  for (size_t idx = sorted.size() - take; idx < sorted.size(); ++idx) {
    top += sorted[idx];
  }
  return clampUnit(top / total);
}

double bottomShare(const std::vector<double>& sorted, double fraction) {
  if (sorted.empty()) return 0.0;
  double total = sortedSum(sorted);
  if (total <= 0.0) return 0.0;

  size_t take = sliceCount(sorted.size(), fraction);
  double bottom = 0.0;
  for (size_t idx = 0; idx < take; ++idx) bottom += sorted[idx];
  return clampUnit(bottom / total);
}

double palma(const std::vector<double>& sorted) {
  const size_t count = sorted.size();
  if (count < kPalmaMinCount) return 0.0;

  const double num = static_cast<double>(count);
  auto bottom_end = static_cast<size_t>(std::floor(num * 0.4));
  auto top_begin = static_cast<size_t>(std::floor(num * 0.9));

  double bottom = 0.0;
  for (size_t idx = 0; idx < bottom_end; ++idx) bottom += sorted[idx];
  double top = 0.0;
  for (size_t idx = top_begin; idx < count; ++idx) top += sorted[idx];

  if (bottom <= 0.0) {
    return top > 0.0 ? std::numeric_limits<double>::infinity() : 0.0;
  }
  return top / bottom;
}

double skewness(const std::vector<double>& sorted, double mean, double stddev) {
  const size_t count = sorted.size();
  if (count < 3 || stddev <= 0.0) return 0.0;

  double acc = 0.0;
  for (double val : sorted) {
    double dev = val - mean;
    acc += dev * dev * dev;
  }
  return acc / (static_cast<double>(count) * stddev * stddev * stddev);
}

double excessKurtosis(const std::vector<double>& sorted, double mean,
                      double stddev) {
  const size_t count = sorted.size();
  if (count < 4 || stddev <= 0.0) return 0.0;

  double acc = 0.0;
  for (double val : sorted) {
    double dev = val - mean;
    acc += dev * dev * dev * dev;
  }
  double var = stddev * stddev;
  return acc / (static_cast<double>(count) * var * var) - 3.0;
}

}  // namespace stats
}  // namespace dirstat
