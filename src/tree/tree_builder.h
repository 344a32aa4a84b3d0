// Directory tree reconstruction from flat file records.

#ifndef DIRSTAT_TREE_TREE_BUILDER_H
#define DIRSTAT_TREE_TREE_BUILDER_H

#include <map>
#include <set>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace dirstat {

/// @brief One directory implied by the input paths.
struct DirectoryNode {
  std::string path;         ///< "/" for the root, otherwise "src/lib".
  std::string parent_path;  ///< Empty for the root.
  int depth = 0;            ///< Root is 0.
  std::set<std::string> child_paths;

  /// Indices into DirectoryTree::records of files directly in this directory,
  /// ascending by record path.
  std::vector<size_t> direct_files;

  bool isLeaf() const { return child_paths.empty(); }
  bool isRoot() const { return parent_path.empty(); }
};

/// @brief Directory hierarchy over the accepted file records.
///
/// Records are stored sorted by path, so every index list derived from the
/// tree is in a canonical order regardless of input order.
struct DirectoryTree {
  std::vector<FileRecord> records;
  std::map<std::string, DirectoryNode> nodes;  ///< Keyed by directory path.

  const DirectoryNode& root() const;
  const DirectoryNode* find(const std::string& path) const;

  /// @brief Directory paths in listing order (root first, then lexicographic).
  std::vector<std::string> sortedPaths() const;

  /// @brief Directory paths ordered deepest first; ties by listing order.
  ///
  /// Every directory appears after all of its descendants.
  std::vector<std::string> postOrderPaths() const;
};

/// @brief Outcome of tree construction.
struct TreeBuildResult {
  DirectoryTree tree;
  std::vector<RecordError> errors;  ///< Rejected records, in input order.
};

/// @brief Build the directory tree from file records.
///
/// Rejects records with invalid paths (InvalidPath), duplicate paths
/// (DuplicatePath, the first occurrence is kept) and non-finite or negative
/// metric values (NonNumericMetric / NegativeMetric). The root "/" is always
/// present, even for empty input.
///
/// @param records Input records in any order.
/// @return Tree over the accepted records plus the rejection list.
TreeBuildResult buildTree(const std::vector<FileRecord>& records);

}  // namespace dirstat

#endif  // DIRSTAT_TREE_TREE_BUILDER_H
