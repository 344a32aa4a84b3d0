// Direct and recursive per-directory rollup.

#include "rollup/rollup_aggregator.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

#include "core/path_utils.h"

namespace dirstat {

const char* rollupStrategyToString(RollupStrategy strategy) {
  switch (strategy) {
    case RollupStrategy::BottomUp:        return "bottom_up";
    case RollupStrategy::AncestorClosure: return "ancestor_closure";
  }
  return "unknown";
}

bool rollupStrategyFromString(const std::string& name, RollupStrategy& out) {
  if (name == "bottom_up") {
    out = RollupStrategy::BottomUp;
    return true;
  }
  if (name == "ancestor_closure" || name == "closure") {
    out = RollupStrategy::AncestorClosure;
    return true;
  }
  return false;
}

RollupAggregator::RollupAggregator(const DirectoryTree& tree,
                                   const Classifier& classifier,
                                   RollupConfig config)
    : tree_(tree), config_(std::move(config)) {
  if (config_.tracked_metrics.empty()) {
    std::set<std::string> seen;
    for (const auto& record : tree_.records) {
      for (const auto& entry : record.metrics) seen.insert(entry.first);
    }
    metric_names_.assign(seen.begin(), seen.end());
  } else {
    // First occurrence wins; a repeated name would be summed twice.
    std::set<std::string> seen;
    for (const auto& name : config_.tracked_metrics) {
      if (seen.insert(name).second) metric_names_.push_back(name);
    }
  }
  if (std::find(metric_names_.begin(), metric_names_.end(), config_.loc_metric) ==
      metric_names_.end()) {
    metric_names_.push_back(config_.loc_metric);
    if (config_.tracked_metrics.empty()) {
      std::sort(metric_names_.begin(), metric_names_.end());
    }
  }

  classes_.reserve(tree_.records.size());
  for (const auto& record : tree_.records) {
    classes_.push_back(classifier.classifyPath(record.path));
  }
}

DirectoryStats RollupAggregator::statsFor(const std::vector<size_t>& indices) const {
  return computeDirectoryStats(tree_.records, classes_, indices, metric_names_,
                               config_.loc_metric);
}

// ---------------------------------------------------------------------------
// Recursive file sets
// ---------------------------------------------------------------------------

std::map<std::string, std::vector<size_t>> RollupAggregator::bottomUpSets() const {
  std::map<std::string, std::vector<size_t>> sets;
  // Deepest first: every child set is complete before its parent reads it.
  for (const auto& path : tree_.postOrderPaths()) {
    const DirectoryNode& node = tree_.nodes.at(path);
    std::vector<size_t> merged = node.direct_files;
    for (const auto& child : node.child_paths) {
      const std::vector<size_t>& child_set = sets.at(child);
      std::vector<size_t> combined;
      combined.reserve(merged.size() + child_set.size());
      std::merge(merged.begin(), merged.end(), child_set.begin(), child_set.end(),
                 std::back_inserter(combined));
      merged.swap(combined);
    }
    sets[path] = std::move(merged);
  }
  return sets;
}

std::map<std::string, std::vector<size_t>> RollupAggregator::closureSets() const {
  std::map<std::string, std::vector<size_t>> sets;
  for (const auto& entry : tree_.nodes) sets[entry.first];

  // Records are visited in ascending index order, so every set stays sorted.
  for (size_t idx = 0; idx < tree_.records.size(); ++idx) {
    std::string dir_path = path_util::parentDirectory(tree_.records[idx].path);
    sets[dir_path].push_back(idx);
    for (const auto& ancestor : path_util::ancestors(dir_path)) {
      sets[ancestor].push_back(idx);
    }
  }
  return sets;
}

std::map<std::string, std::vector<size_t>> RollupAggregator::recursiveFileSets() const {
  return config_.strategy == RollupStrategy::AncestorClosure ? closureSets()
                                                             : bottomUpSets();
}

// ---------------------------------------------------------------------------
// aggregate
// ---------------------------------------------------------------------------

std::vector<DirectoryEntry> RollupAggregator::aggregate() const {
  std::map<std::string, std::vector<size_t>> recursive_sets = recursiveFileSets();

  std::vector<DirectoryEntry> entries;
  entries.reserve(tree_.nodes.size());
  for (const auto& path : tree_.sortedPaths()) {
    const DirectoryNode& node = tree_.nodes.at(path);

    DirectoryEntry entry;
    entry.path = node.path;
    entry.name = node.isRoot() ? std::string(kRootPath) : path_util::filename(node.path);
    entry.depth = node.depth;
    entry.is_leaf = node.isLeaf();
    entry.child_count = node.child_paths.size();
    entry.subdirectories.assign(node.child_paths.begin(), node.child_paths.end());

    entry.direct = statsFor(node.direct_files);
    const std::vector<size_t>& subtree = recursive_sets.at(path);
    if (subtree == node.direct_files) {
      entry.recursive = entry.direct;
    } else {
      entry.recursive = statsFor(subtree);
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

}  // namespace dirstat
