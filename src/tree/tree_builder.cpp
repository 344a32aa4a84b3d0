// Directory tree reconstruction.

#include "tree/tree_builder.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

#include "core/path_utils.h"

namespace dirstat {
namespace {

/// @brief Check metric values of a record.
/// @return True if all values are finite and non-negative.
bool checkMetrics(const FileRecord& record, RecordError& error) {
  for (const auto& [name, value] : record.metrics) {
    if (!std::isfinite(value)) {
      error = {record.path, RecordErrorKind::NonNumericMetric,
               "metric '" + name + "' is not a finite number"};
      return false;
    }
    if (value < 0.0) {
      error = {record.path, RecordErrorKind::NegativeMetric,
               "metric '" + name + "' is negative"};
      return false;
    }
  }
  return true;
}

/// @brief Register a directory and every missing ancestor, linking parent/child.
void registerDirectory(std::map<std::string, DirectoryNode>& nodes,
                       const std::string& dir_path) {
  std::string child;
  std::string current = dir_path;
  while (true) {
    auto iter = nodes.find(current);
    bool existed = iter != nodes.end();
    if (!existed) {
      DirectoryNode node;
      node.path = current;
      node.depth = path_util::directoryDepth(current);
      if (current != kRootPath) {
        node.parent_path = path_util::parentDirectory(current);
      }
      iter = nodes.emplace(current, std::move(node)).first;
    }
    if (!child.empty()) iter->second.child_paths.insert(child);
    if (existed || iter->second.isRoot()) break;

    child = current;
    current = iter->second.parent_path;
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// DirectoryTree
// ---------------------------------------------------------------------------

const DirectoryNode& DirectoryTree::root() const {
  return nodes.at(kRootPath);
}

const DirectoryNode* DirectoryTree::find(const std::string& path) const {
  auto iter = nodes.find(path);
  return iter != nodes.end() ? &iter->second : nullptr;
}

std::vector<std::string> DirectoryTree::sortedPaths() const {
  std::vector<std::string> paths;
  paths.reserve(nodes.size());
  for (const auto& entry : nodes) paths.push_back(entry.first);
  std::sort(paths.begin(), paths.end(), path_util::directoryLess);
  return paths;
}

std::vector<std::string> DirectoryTree::postOrderPaths() const {
  std::vector<std::string> paths = sortedPaths();
  std::stable_sort(paths.begin(), paths.end(),
                   [this](const std::string& lhs, const std::string& rhs) {
                     return nodes.at(lhs).depth > nodes.at(rhs).depth;
                   });
  return paths;
}

// ---------------------------------------------------------------------------
// buildTree
// ---------------------------------------------------------------------------

TreeBuildResult buildTree(const std::vector<FileRecord>& records) {
  TreeBuildResult result;
  DirectoryTree& tree = result.tree;

  std::set<std::string> seen;
  for (const auto& record : records) {
    std::string reason;
    if (!path_util::isValidRelativePath(record.path, &reason)) {
      result.errors.push_back({record.path, RecordErrorKind::InvalidPath, reason});
      continue;
    }
    RecordError metric_error;
    if (!checkMetrics(record, metric_error)) {
      result.errors.push_back(metric_error);
      continue;
    }
    if (!seen.insert(record.path).second) {
      result.errors.push_back({record.path, RecordErrorKind::DuplicatePath,
                               "path already present in input"});
      continue;
    }
    tree.records.push_back(record);
  }

  std::sort(tree.records.begin(), tree.records.end(),
            [](const FileRecord& lhs, const FileRecord& rhs) {
              return lhs.path < rhs.path;
            });

  registerDirectory(tree.nodes, kRootPath);
  for (size_t idx = 0; idx < tree.records.size(); ++idx) {
    std::string dir_path = path_util::parentDirectory(tree.records[idx].path);
    registerDirectory(tree.nodes, dir_path);
    tree.nodes[dir_path].direct_files.push_back(idx);
  }

  return result;
}

}  // namespace dirstat
