// Direct and recursive per-directory rollup.

#ifndef DIRSTAT_ROLLUP_ROLLUP_AGGREGATOR_H
#define DIRSTAT_ROLLUP_ROLLUP_AGGREGATOR_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "rollup/directory_stats.h"
#include "tree/classifier.h"
#include "tree/tree_builder.h"

namespace dirstat {

/// How recursive file sets are formed. Both produce identical stats.
enum class RollupStrategy : uint8_t {
  BottomUp,        ///< Children first; parent = own files + children's sets.
  AncestorClosure  ///< Each file is attributed to every ancestor directory.
};

/// @brief Convert RollupStrategy to string ("bottom_up", "ancestor_closure").
const char* rollupStrategyToString(RollupStrategy strategy);

/// @brief Parse a strategy name.
/// @return False if `name` is not a known strategy (out is untouched).
bool rollupStrategyFromString(const std::string& name, RollupStrategy& out);

/// Rollup options.
struct RollupConfig {
  /// Metrics to sum and profile. Empty = every metric name seen in the input.
  /// The loc metric is always added.
  std::vector<std::string> tracked_metrics;
  /// Metric that measures code size (per-class LOC, total_loc, COCOMO).
  std::string loc_metric = metric::kLinesCode;
  RollupStrategy strategy = RollupStrategy::BottomUp;
};

/// @brief Rollup result for one directory.
struct DirectoryEntry {
  std::string path;
  std::string name;  ///< Last path component, "/" for the root.
  int depth = 0;
  bool is_leaf = true;
  uint64_t child_count = 0;
  std::vector<std::string> subdirectories;  ///< Sorted child paths.
  DirectoryStats direct;
  DirectoryStats recursive;
};

/// @brief Computes direct and recursive stats for every directory of a tree.
class RollupAggregator {
 public:
  /// @param tree Tree to aggregate; must outlive the aggregator.
  RollupAggregator(const DirectoryTree& tree, const Classifier& classifier,
                   RollupConfig config);

  /// @brief Aggregate all directories.
  /// @return One entry per directory, root first, then lexicographic by path.
  std::vector<DirectoryEntry> aggregate() const;

  /// @brief Recursive file sets (ascending record indices) per directory.
  std::map<std::string, std::vector<size_t>> recursiveFileSets() const;

  /// @brief Stats over an arbitrary set of records (ascending indices).
  DirectoryStats statsFor(const std::vector<size_t>& indices) const;

  /// Tracked metric names actually used (sorted when derived from input).
  const std::vector<std::string>& metricNames() const { return metric_names_; }

  /// Classification of each record in tree order.
  const std::vector<FileClass>& classes() const { return classes_; }

  const RollupConfig& config() const { return config_; }

 private:
  std::map<std::string, std::vector<size_t>> bottomUpSets() const;
  std::map<std::string, std::vector<size_t>> closureSets() const;

  const DirectoryTree& tree_;
  RollupConfig config_;
  std::vector<std::string> metric_names_;
  std::vector<FileClass> classes_;
};

}  // namespace dirstat

#endif  // DIRSTAT_ROLLUP_ROLLUP_AGGREGATOR_H
