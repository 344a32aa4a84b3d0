// Directory scope statistics.

#include "rollup/directory_stats.h"

#include <utility>

namespace dirstat {

uint64_t ClassificationCounts::total() const {
  uint64_t sum = 0;
  for (uint64_t count : files) sum += count;
  return sum;
}

double safeRatio(double num, double den) {
  return den != 0.0 ? num / den : 0.0;
}

// ---------------------------------------------------------------------------
// DirectoryStats ratios
// ---------------------------------------------------------------------------

double DirectoryStats::total(const std::string& name) const {
  auto iter = totals.find(name);
  return iter != totals.end() ? iter->second : 0.0;
}

double DirectoryStats::avgFileLoc() const {
  return safeRatio(total(metric::kLinesCode), static_cast<double>(file_count));
}

double DirectoryStats::avgComplexity() const {
  return safeRatio(total(metric::kComplexity), static_cast<double>(file_count));
}

double DirectoryStats::commentRatio() const {
  return safeRatio(total(metric::kLinesComment), total(metric::kLinesTotal));
}

double DirectoryStats::blankRatio() const {
  return safeRatio(total(metric::kLinesBlank), total(metric::kLinesTotal));
}

double DirectoryStats::dryness() const {
  return safeRatio(total(metric::kUloc), total(metric::kLinesCode));
}

double DirectoryStats::complexityDensity() const {
  return safeRatio(total(metric::kComplexity), total(metric::kLinesCode));
}

double DirectoryStats::generatedRatio() const {
  return safeRatio(static_cast<double>(generated_count), static_cast<double>(file_count));
}

double DirectoryStats::minifiedRatio() const {
  return safeRatio(static_cast<double>(minified_count), static_cast<double>(file_count));
}

// ---------------------------------------------------------------------------
// computeDirectoryStats
// ---------------------------------------------------------------------------

DirectoryStats computeDirectoryStats(const std::vector<FileRecord>& records,
                                     const std::vector<FileClass>& classes,
                                     const std::vector<size_t>& indices,
                                     const std::vector<std::string>& metric_names,
                                     const std::string& loc_metric) {
  DirectoryStats stats;
  stats.file_count = indices.size();

  std::map<std::string, std::vector<double>> values;
  for (const auto& name : metric_names) {
    stats.totals[name] = 0.0;
    values[name].reserve(indices.size());
  }
  std::vector<double> comment_ratios;
  comment_ratios.reserve(indices.size());

  for (size_t idx : indices) {
    const FileRecord& record = records[idx];

    LanguageTotals& lang = stats.by_language[record.language];
    if (lang.file_count == 0) {
      for (const auto& name : metric_names) lang.totals[name] = 0.0;
    }
    ++lang.file_count;

    for (const auto& name : metric_names) {
      double val = record.metricOr0(name);
      stats.totals[name] += val;
      lang.totals[name] += val;
      values[name].push_back(val);
    }

    comment_ratios.push_back(safeRatio(record.metricOr0(metric::kLinesComment),
                                       record.metricOr0(metric::kLinesTotal)));

    auto cls = static_cast<size_t>(classes[idx]);
    ++stats.classes.files[cls];
    stats.classes.loc[cls] += record.metricOr0(loc_metric);

    if (record.flags.is_minified) ++stats.minified_count;
    if (record.flags.is_generated) ++stats.generated_count;
    if (record.flags.is_binary) ++stats.binary_count;
  }

  for (auto& [name, sample] : values) {
    stats.distributions[name] = MetricDistribution::fromValues(std::move(sample));
  }
  stats.comment_ratio_distribution = MetricDistribution::fromValues(std::move(comment_ratios));
  return stats;
}

}  // namespace dirstat
