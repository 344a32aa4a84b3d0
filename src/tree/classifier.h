// File classification (test / config / build / ci / docs / source).

#ifndef DIRSTAT_TREE_CLASSIFIER_H
#define DIRSTAT_TREE_CLASSIFIER_H

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/basic_types.h"

namespace dirstat {

/// @brief One classification rule. A file matches if any listed pattern matches.
///
/// All lists except `exact_globs` are compared case-insensitively; entries
/// are written in lowercase.
struct ClassRule {
  FileClass cls = FileClass::Source;

  /// Path fragments that must start at a segment boundary, e.g.
  /// ".github/workflows/" matches "x/.github/workflows/ci.yml".
  std::vector<std::string> path_markers;

  /// Directory names matched against every directory segment of the path.
  std::vector<std::string> dir_names;

  /// Exact filenames.
  std::vector<std::string> filenames;

  /// fnmatch(3) patterns against the lowercased filename.
  std::vector<std::string> globs;

  /// fnmatch(3) patterns against the filename as written ("*Test.*").
  std::vector<std::string> exact_globs;

  /// Extensions including the dot.
  std::vector<std::string> extensions;
};

/// @brief Ordered rule table; the first matching rule wins.
struct ClassificationRules {
  std::vector<ClassRule> rules;

  /// @brief Default table: ci, build, test, config, docs (in that order).
  static ClassificationRules defaults();
};

/// @brief Classifies file paths against a rule table.
class Classifier {
 public:
  Classifier() : rules_(ClassificationRules::defaults()) {}
  explicit Classifier(ClassificationRules rules) : rules_(std::move(rules)) {}

  /// @brief Classify a file.
  /// @param path Repository-relative path.
  /// @param filename Final path component.
  /// @param extension Extension with dot, or "".
  /// @return Class of the first matching rule, FileClass::Source if none.
  FileClass classify(std::string_view path, std::string_view filename,
                     std::string_view extension) const;

  /// @brief Classify a path, deriving filename and extension from it.
  FileClass classifyPath(std::string_view path) const;

  const ClassificationRules& rules() const { return rules_; }

 private:
  ClassificationRules rules_;
};

}  // namespace dirstat

#endif  // DIRSTAT_TREE_CLASSIFIER_H
