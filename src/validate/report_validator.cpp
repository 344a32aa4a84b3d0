// Consistency checks over a finished rollup report.

#include "validate/report_validator.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

#include "core/json_helpers.h"
#include "core/path_utils.h"

namespace dirstat {

namespace {

/// Metric label used in violations of the comment ratio distribution.
constexpr const char* kCommentRatioDistribution = "comment_ratio";

bool approxEqual(double lhs, double rhs) {
  double scale = std::max({1.0, std::fabs(lhs), std::fabs(rhs)});
  return std::fabs(lhs - rhs) <= kSumTolerance * scale;
}

bool approxLessEqual(double lhs, double rhs) {
  return lhs <= rhs || approxEqual(lhs, rhs);
}

void addViolation(ValidationReport& out, const char* check_id, const std::string& path,
                  const std::string& metric, double expected, double actual,
                  std::string message) {
  Violation violation;
  violation.check_id = check_id;
  violation.path = path;
  violation.metric = metric;
  violation.expected = expected;
  violation.actual = actual;
  violation.message = std::move(message);
  out.violations.push_back(std::move(violation));
}

using DirectoryIndex = std::map<std::string, const DirectoryEntry*>;

DirectoryIndex indexDirectories(const RollupReport& report) {
  DirectoryIndex index;
  for (const auto& dir : report.directories) index[dir.path] = &dir;
  return index;
}

/// Apply `fn(scope_name, stats)` to the direct and recursive scope of a directory.
template <typename Fn>
void forEachScope(const DirectoryEntry& dir, Fn fn) {
  fn("direct", dir.direct);
  fn("recursive", dir.recursive);
}

/// Apply `fn(name, dist)` to every distribution of a scope, the per-file
/// comment ratio included.
template <typename Fn>
void forEachDistribution(const DirectoryStats& stats, Fn fn) {
  for (const auto& [name, dist] : stats.distributions) fn(name, dist);
  fn(std::string(kCommentRatioDistribution), stats.comment_ratio_distribution);
}

// ---------------------------------------------------------------------------
// Rollup sums
// ---------------------------------------------------------------------------

void checkRecursiveFileCount(const RollupReport& report, const DirectoryIndex& index,
                             ValidationReport& out) {
  for (const auto& dir : report.directories) {
    double direct = static_cast<double>(dir.direct.file_count);
    double recursive = static_cast<double>(dir.recursive.file_count);
    if (recursive < direct) {
      addViolation(out, check::kRecursiveFileCount, dir.path, "file_count", direct, recursive,
                   "recursive file count is below the direct file count");
    }

    double expected = direct;
    for (const auto& child : dir.subdirectories) {
      auto iter = index.find(child);
      if (iter != index.end()) expected += static_cast<double>(iter->second->recursive.file_count);
    }
    if (recursive != expected) {
      addViolation(out, check::kRecursiveFileCount, dir.path, "file_count", expected, recursive,
                   "recursive file count differs from direct plus children");
    }
  }

  if (const DirectoryEntry* root = report.findDirectory(kRootPath)) {
    double expected = static_cast<double>(report.files.size());
    double actual = static_cast<double>(root->recursive.file_count);
    if (actual != expected) {
      addViolation(out, check::kRecursiveFileCount, kRootPath, "file_count", expected, actual,
                   "root recursive file count differs from the number of files");
    }
  }
}

void checkRecursiveMetricSum(const RollupReport& report, const DirectoryIndex& index,
                             ValidationReport& out) {
  for (const auto& dir : report.directories) {
    for (const auto& name : report.metric_names) {
      double direct = dir.direct.total(name);
      double recursive = dir.recursive.total(name);
      if (!approxLessEqual(direct, recursive)) {
        addViolation(out, check::kRecursiveMetricSum, dir.path, name, direct, recursive,
                     "recursive total is below the direct total");
      }

      double expected = direct;
      for (const auto& child : dir.subdirectories) {
        auto iter = index.find(child);
        if (iter != index.end()) expected += iter->second->recursive.total(name);
      }
      if (!approxEqual(recursive, expected)) {
        addViolation(out, check::kRecursiveMetricSum, dir.path, name, expected, recursive,
                     "recursive total differs from direct plus children");
      }
    }
  }
}

void checkDirectFileCountTotal(const RollupReport& report, ValidationReport& out) {
  uint64_t direct_sum = 0;
  for (const auto& dir : report.directories) direct_sum += dir.direct.file_count;

  double expected = static_cast<double>(report.summary.total_files);
  if (static_cast<double>(direct_sum) != expected) {
    addViolation(out, check::kDirectFileCountTotal, "", "file_count", expected,
                 static_cast<double>(direct_sum),
                 "direct file counts do not sum to the total file count");
  }
  if (report.files.size() != report.summary.total_files) {
    addViolation(out, check::kDirectFileCountTotal, "", "files", expected,
                 static_cast<double>(report.files.size()),
                 "file list length differs from the total file count");
  }
}

// ---------------------------------------------------------------------------
// Distributions
// ---------------------------------------------------------------------------

void checkPercentileOrder(const RollupReport& report, ValidationReport& out) {
  for (const auto& dir : report.directories) {
    forEachScope(dir, [&](const char* scope, const DirectoryStats& stats) {
      forEachDistribution(stats, [&](const std::string& name, const MetricDistribution& dist) {
        const std::pair<const char*, double> chain[] = {
            {"min", dist.min}, {"p25", dist.p25}, {"median", dist.median},
            {"p75", dist.p75}, {"p90", dist.p90}, {"p95", dist.p95},
            {"p99", dist.p99}, {"max", dist.max}};
        for (size_t idx = 1; idx < sizeof(chain) / sizeof(chain[0]); ++idx) {
          if (!approxLessEqual(chain[idx - 1].second, chain[idx].second)) {
            addViolation(out, check::kPercentileOrder, dir.path, name, chain[idx - 1].second,
                         chain[idx].second,
                         std::string(scope) + ": " + chain[idx].first + " is below " +
                             chain[idx - 1].first);
          }
        }
      });
    });
  }
}

void checkMeanBounds(const RollupReport& report, ValidationReport& out) {
  for (const auto& dir : report.directories) {
    forEachScope(dir, [&](const char* scope, const DirectoryStats& stats) {
      forEachDistribution(stats, [&](const std::string& name, const MetricDistribution& dist) {
        if (!approxLessEqual(dist.min, dist.mean)) {
          addViolation(out, check::kMeanBounds, dir.path, name, dist.min, dist.mean,
                       std::string(scope) + ": mean is below min");
        }
        if (!approxLessEqual(dist.mean, dist.max)) {
          addViolation(out, check::kMeanBounds, dir.path, name, dist.max, dist.mean,
                       std::string(scope) + ": mean is above max");
        }
      });
    });
  }
}

void checkUnitInterval(ValidationReport& out, const std::string& path, const std::string& name,
                       const char* scope, const char* field, double value) {
  if (!(approxLessEqual(0.0, value) && approxLessEqual(value, 1.0))) {
    addViolation(out, check::kInequalityBounds, path, name, 1.0, value,
                 std::string(scope) + ": " + field + " is outside [0, 1]");
  }
}

void checkInequalityBounds(const RollupReport& report, ValidationReport& out) {
  for (const auto& dir : report.directories) {
    forEachScope(dir, [&](const char* scope, const DirectoryStats& stats) {
      forEachDistribution(stats, [&](const std::string& name, const MetricDistribution& dist) {
        checkUnitInterval(out, dir.path, name, scope, "gini", dist.gini);
        checkUnitInterval(out, dir.path, name, scope, "hoover", dist.hoover);
        checkUnitInterval(out, dir.path, name, scope, "top_10_pct_share",
                          dist.top_10_pct_share);
        checkUnitInterval(out, dir.path, name, scope, "top_20_pct_share",
                          dist.top_20_pct_share);
        checkUnitInterval(out, dir.path, name, scope, "bottom_50_pct_share",
                          dist.bottom_50_pct_share);
        if (!(dist.theil >= 0.0)) {
          addViolation(out, check::kInequalityBounds, dir.path, name, 0.0, dist.theil,
                       std::string(scope) + ": theil is negative");
        }
        // +infinity is a legal palma value; NaN is not.
        if (!(dist.palma >= 0.0)) {
          addViolation(out, check::kInequalityBounds, dir.path, name, 0.0, dist.palma,
                       std::string(scope) + ": palma is negative or undefined");
        }
      });
    });
  }
}

// ---------------------------------------------------------------------------
// Sign, structure and breakdowns
// ---------------------------------------------------------------------------

void checkNonNegative(const RollupReport& report, ValidationReport& out) {
  for (const auto& dir : report.directories) {
    forEachScope(dir, [&](const char* scope, const DirectoryStats& stats) {
      for (const auto& [name, total] : stats.totals) {
        if (!(total >= 0.0)) {
          addViolation(out, check::kNonNegative, dir.path, name, 0.0, total,
                       std::string(scope) + ": negative total");
        }
      }
      forEachDistribution(stats, [&](const std::string& name, const MetricDistribution& dist) {
        if (!(dist.min >= 0.0)) {
          addViolation(out, check::kNonNegative, dir.path, name, 0.0, dist.min,
                       std::string(scope) + ": negative minimum");
        }
        if (!(dist.stddev >= 0.0)) {
          addViolation(out, check::kNonNegative, dir.path, name, 0.0, dist.stddev,
                       std::string(scope) + ": negative standard deviation");
        }
      });
    });
  }

  for (const auto& [name, estimate] : report.summary.cocomo) {
    const std::pair<const char*, double> fields[] = {
        {"effort_person_months", estimate.effort_person_months},
        {"schedule_months", estimate.schedule_months},
        {"people", estimate.people},
        {"cost", estimate.cost}};
    for (const auto& [field, value] : fields) {
      if (!(value >= 0.0)) {
        addViolation(out, check::kNonNegative, name, field, 0.0, value,
                     "negative cost estimate");
      }
    }
  }
}

void checkStructure(const RollupReport& report, const DirectoryIndex& index,
                    ValidationReport& out) {
  if (!report.findDirectory(kRootPath)) {
    addViolation(out, check::kStructure, kRootPath, "", 1.0, 0.0, "root directory is missing");
  }

  for (size_t idx = 0; idx < report.directories.size(); ++idx) {
    const DirectoryEntry& dir = report.directories[idx];
    if (idx > 0 && !path_util::directoryLess(report.directories[idx - 1].path, dir.path)) {
      addViolation(out, check::kStructure, dir.path, "order", 0.0, 0.0,
                   "directories are not in listing order");
    }

    bool has_children = !dir.subdirectories.empty();
    if (dir.is_leaf == has_children) {
      addViolation(out, check::kStructure, dir.path, "is_leaf", has_children ? 0.0 : 1.0,
                   dir.is_leaf ? 1.0 : 0.0, "is_leaf does not match subdirectories");
    }
    if (dir.child_count != dir.subdirectories.size()) {
      addViolation(out, check::kStructure, dir.path, "child_count",
                   static_cast<double>(dir.subdirectories.size()),
                   static_cast<double>(dir.child_count),
                   "child_count does not match subdirectories");
    }

    int expected_depth = path_util::directoryDepth(dir.path);
    if (dir.depth != expected_depth) {
      addViolation(out, check::kStructure, dir.path, "depth", expected_depth, dir.depth,
                   "depth does not match the path");
    }

    for (const auto& child : dir.subdirectories) {
      auto iter = index.find(child);
      if (iter == index.end()) {
        addViolation(out, check::kStructure, dir.path, child, 1.0, 0.0,
                     "subdirectory has no entry");
      } else if (iter->second->depth != dir.depth + 1) {
        addViolation(out, check::kStructure, child, "depth", dir.depth + 1,
                     iter->second->depth, "child depth is not parent depth + 1");
      }
    }
  }
}

void checkClassificationTotal(const RollupReport& report, ValidationReport& out) {
  for (const auto& dir : report.directories) {
    forEachScope(dir, [&](const char* scope, const DirectoryStats& stats) {
      if (stats.classes.total() != stats.file_count) {
        addViolation(out, check::kClassificationTotal, dir.path, "file_count",
                     static_cast<double>(stats.file_count),
                     static_cast<double>(stats.classes.total()),
                     std::string(scope) + ": classification counts do not sum to file_count");
      }
    });
  }
}

void checkLanguageTotal(const RollupReport& report, ValidationReport& out) {
  for (const auto& dir : report.directories) {
    forEachScope(dir, [&](const char* scope, const DirectoryStats& stats) {
      uint64_t files = 0;
      MetricMap sums;
      for (const auto& [language, totals] : stats.by_language) {
        files += totals.file_count;
        for (const auto& [name, value] : totals.totals) sums[name] += value;
      }
      if (files != stats.file_count) {
        addViolation(out, check::kLanguageTotal, dir.path, "file_count",
                     static_cast<double>(stats.file_count), static_cast<double>(files),
                     std::string(scope) + ": language file counts do not sum to file_count");
      }
      for (const auto& [name, total] : stats.totals) {
        auto iter = sums.find(name);
        double actual = iter != sums.end() ? iter->second : 0.0;
        if (!approxEqual(total, actual)) {
          addViolation(out, check::kLanguageTotal, dir.path, name, total, actual,
                       std::string(scope) + ": language totals do not sum to the metric total");
        }
      }
    });
  }
}

// ---------------------------------------------------------------------------
// Cost
// ---------------------------------------------------------------------------

void checkCocomoMonotonic(const RollupReport& report, const CocomoPresetTable& presets,
                          ValidationReport& out) {
  struct Point {
    std::string name;
    double wage;
    double cost;
  };
  std::vector<Point> points;
  for (const auto& [name, estimate] : report.summary.cocomo) {
    const CocomoPreset* preset = findPreset(presets, name);
    if (!preset) {
      addViolation(out, check::kCocomoMonotonic, name, "", 0.0, 0.0,
                   "estimate has no matching preset");
      continue;
    }
    points.push_back({name, preset->monthlyWage(), estimate.cost});
  }

  std::stable_sort(points.begin(), points.end(),
                   [](const Point& lhs, const Point& rhs) { return lhs.wage < rhs.wage; });
  // Each preset is compared with the most expensive preset of any strictly
  // lower wage; equal-wage presets are not ordered against each other.
  const Point* costliest_below = nullptr;
  size_t group_begin = 0;
  while (group_begin < points.size()) {
    size_t group_end = group_begin;
    while (group_end < points.size() && points[group_end].wage == points[group_begin].wage) {
      ++group_end;
    }
    for (size_t idx = group_begin; idx < group_end; ++idx) {
      const Point& dearer = points[idx];
      if (costliest_below && !approxLessEqual(costliest_below->cost, dearer.cost)) {
        addViolation(out, check::kCocomoMonotonic, dearer.name, "cost", costliest_below->cost,
                     dearer.cost,
                     "costs less than lower-wage preset '" + costliest_below->name + "'");
      }
    }
    for (size_t idx = group_begin; idx < group_end; ++idx) {
      if (!costliest_below || points[idx].cost > costliest_below->cost) {
        costliest_below = &points[idx];
      }
    }
    group_begin = group_end;
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// ValidationReport
// ---------------------------------------------------------------------------

std::vector<Violation> ValidationReport::violationsFor(const std::string& check_id) const {
  std::vector<Violation> result;
  for (const auto& violation : violations) {
    if (violation.check_id == check_id) {
      result.push_back(violation);
    }
  }
  return result;
}

std::string ValidationReport::toJson() const {
  JsonWriter writer;
  writer.beginObject();

  writer.key("passed");
  writer.value(passed());
  writer.key("checks_run");
  writer.beginArray();
  for (const auto& check_id : checks_run) writer.value(check_id);
  writer.endArray();

  writer.key("violations");
  writer.beginArray();
  for (const auto& violation : violations) {
    writer.beginObject();
    writer.key("check");
    writer.value(violation.check_id);
    writer.key("path");
    writer.value(violation.path);
    writer.key("metric");
    writer.value(violation.metric);
    writer.key("expected");
    writer.value(violation.expected);
    writer.key("actual");
    writer.value(violation.actual);
    writer.key("message");
    writer.value(violation.message);
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return writer.toPrettyString();
}

// ---------------------------------------------------------------------------
// validateReport
// ---------------------------------------------------------------------------

ValidationReport validateReport(const RollupReport& report, const CocomoPresetTable& presets) {
  ValidationReport out;
  DirectoryIndex index = indexDirectories(report);

  checkRecursiveFileCount(report, index, out);
  out.checks_run.push_back(check::kRecursiveFileCount);
  checkRecursiveMetricSum(report, index, out);
  out.checks_run.push_back(check::kRecursiveMetricSum);
  checkPercentileOrder(report, out);
  out.checks_run.push_back(check::kPercentileOrder);
  checkMeanBounds(report, out);
  out.checks_run.push_back(check::kMeanBounds);
  checkInequalityBounds(report, out);
  out.checks_run.push_back(check::kInequalityBounds);
  checkNonNegative(report, out);
  out.checks_run.push_back(check::kNonNegative);
  checkDirectFileCountTotal(report, out);
  out.checks_run.push_back(check::kDirectFileCountTotal);
  checkStructure(report, index, out);
  out.checks_run.push_back(check::kStructure);
  checkClassificationTotal(report, out);
  out.checks_run.push_back(check::kClassificationTotal);
  checkLanguageTotal(report, out);
  out.checks_run.push_back(check::kLanguageTotal);
  checkCocomoMonotonic(report, presets, out);
  out.checks_run.push_back(check::kCocomoMonotonic);
  return out;
}

}  // namespace dirstat
