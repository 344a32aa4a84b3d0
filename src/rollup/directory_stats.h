// Aggregate statistics for a set of files (one directory scope).

#ifndef DIRSTAT_ROLLUP_DIRECTORY_STATS_H
#define DIRSTAT_ROLLUP_DIRECTORY_STATS_H

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "stats/distribution.h"

namespace dirstat {

/// Per-language sums (keyed sums, not distributions).
struct LanguageTotals {
  uint64_t file_count = 0;
  MetricMap totals;  ///< Same key set as DirectoryStats::totals.
};

/// @brief File counts and code size per classification.
struct ClassificationCounts {
  std::array<uint64_t, kFileClassCount> files{};
  std::array<double, kFileClassCount> loc{};

  uint64_t count(FileClass cls) const { return files[static_cast<size_t>(cls)]; }
  double locOf(FileClass cls) const { return loc[static_cast<size_t>(cls)]; }
  uint64_t total() const;
};

/// @brief Aggregate statistics for one scope (direct or recursive) of a directory.
///
/// `totals`, every `by_language` entry and `distributions` share one key
/// set: the tracked metric names of the rollup, so the output shape does not
/// depend on which metrics a particular directory happens to contain.
struct DirectoryStats {
  uint64_t file_count = 0;
  MetricMap totals;
  std::map<std::string, LanguageTotals> by_language;
  ClassificationCounts classes;
  uint64_t minified_count = 0;
  uint64_t generated_count = 0;
  uint64_t binary_count = 0;
  std::map<std::string, MetricDistribution> distributions;
  /// Per-file lines_comment / lines_total (0 for files without lines_total).
  MetricDistribution comment_ratio_distribution;

  uint64_t languageCount() const { return by_language.size(); }

  /// @brief Total for a metric, 0 if not tracked.
  double total(const std::string& name) const;

  // Ratios over well-known metrics; 0 when the denominator is 0.
  double avgFileLoc() const;
  double avgComplexity() const;
  double commentRatio() const;       ///< lines_comment / lines_total.
  double blankRatio() const;         ///< lines_blank / lines_total.
  double dryness() const;            ///< uloc / lines_code.
  double complexityDensity() const;  ///< complexity / lines_code.
  double generatedRatio() const;     ///< generated_count / file_count.
  double minifiedRatio() const;      ///< minified_count / file_count.
};

/// @brief Compute statistics for a list of records.
///
/// @param records All accepted records.
/// @param classes Classification of each record (parallel to `records`).
/// @param indices Records in scope, ascending.
/// @param metric_names Tracked metric names; missing values count as 0.
/// @param loc_metric Metric used for per-class code size.
DirectoryStats computeDirectoryStats(const std::vector<FileRecord>& records,
                                     const std::vector<FileClass>& classes,
                                     const std::vector<size_t>& indices,
                                     const std::vector<std::string>& metric_names,
                                     const std::string& loc_metric);

/// @brief Safe ratio helper: num / den, or 0 when den is 0.
double safeRatio(double num, double den);

}  // namespace dirstat

#endif  // DIRSTAT_ROLLUP_DIRECTORY_STATS_H
