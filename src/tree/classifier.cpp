// File classification rules and matcher.

#include "tree/classifier.h"

#include <fnmatch.h>

#include <algorithm>

#include "core/path_utils.h"

namespace dirstat {
namespace {

/// @brief Check whether `marker` occurs in `path` starting at a segment boundary.
bool hasPathMarker(const std::string& path, const std::string& marker) {
  size_t pos = path.find(marker);
  while (pos != std::string::npos) {
    if (pos == 0 || path[pos - 1] == '/') return true;
    pos = path.find(marker, pos + 1);
  }
  return false;
}

bool globMatches(const std::vector<std::string>& patterns, const std::string& name) {
  for (const auto& pattern : patterns) {
    if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0) return true;
  }
  return false;
}

bool contains(const std::vector<std::string>& list, const std::string& item) {
  return std::find(list.begin(), list.end(), item) != list.end();
}

/// Lowercased pieces of a path, computed once per classify() call.
struct PathParts {
  std::string path;
  std::string filename;
  std::string exact_filename;
  std::string extension;
  std::vector<std::string> dir_segments;
};

bool ruleMatches(const ClassRule& rule, const PathParts& parts) {
  for (const auto& marker : rule.path_markers) {
    if (hasPathMarker(parts.path, marker)) return true;
  }
  for (const auto& segment : parts.dir_segments) {
    if (contains(rule.dir_names, segment)) return true;
  }
  if (contains(rule.filenames, parts.filename)) return true;
  if (globMatches(rule.globs, parts.filename)) return true;
  if (globMatches(rule.exact_globs, parts.exact_filename)) return true;
  if (!parts.extension.empty() && contains(rule.extensions, parts.extension)) {
    return true;
  }
  return false;
}

}  // namespace

ClassificationRules ClassificationRules::defaults() {
  ClassificationRules table;

  ClassRule ci;
  ci.cls = FileClass::Ci;
  ci.path_markers = {".github/workflows/", ".github/actions/", ".circleci/",
                     ".gitlab/", ".buildkite/"};
  ci.filenames = {"jenkinsfile", ".gitlab-ci.yml", ".gitlab-ci.yaml",
                  "azure-pipelines.yml", "azure-pipelines.yaml", ".travis.yml",
                  "appveyor.yml", "bitbucket-pipelines.yml"};
  table.rules.push_back(ci);

  ClassRule build;
  build.cls = FileClass::Build;
  build.filenames = {"makefile", "gnumakefile", "cmakelists.txt", "pom.xml",
                     "build.gradle", "build.gradle.kts", "settings.gradle",
                     "meson.build", "build.sbt", "gulpfile.js", "gruntfile.js",
                     "rakefile", "justfile", "build.xml", "directory.build.props"};
  build.extensions = {".csproj", ".fsproj", ".vbproj", ".sln", ".gradle",
                      ".cmake", ".mk", ".bazel", ".bzl"};
  table.rules.push_back(build);

  ClassRule test;
  test.cls = FileClass::Test;
  test.dir_names = {"tests", "test", "__tests__", "spec", "testing"};
  test.globs = {"test_*", "*_test.*", "*.test.*", "*.spec.*", "*_spec.*"};
  test.exact_globs = {"*Test.*", "*Tests.*"};
  table.rules.push_back(test);

  ClassRule config;
  config.cls = FileClass::Config;
  config.filenames = {"package.json", "tsconfig.json", "pyproject.toml",
                      "setup.py", "setup.cfg", "requirements.txt", "cargo.toml",
                      "go.mod", "go.sum", ".editorconfig", ".gitignore",
                      ".gitattributes", "dockerfile"};
  config.globs = {"*.config.*", ".env*", "*.conf", "settings.*"};
  config.extensions = {".yaml", ".yml", ".toml", ".ini", ".cfg", ".conf",
                       ".properties"};
  table.rules.push_back(config);

  ClassRule docs;
  docs.cls = FileClass::Docs;
  docs.dir_names = {"docs", "doc", "documentation"};
  docs.extensions = {".md", ".rst", ".adoc", ".asciidoc", ".txt"};
  table.rules.push_back(docs);

  return table;
}

FileClass Classifier::classify(std::string_view path, std::string_view filename,
                               std::string_view extension) const {
  PathParts parts;
  parts.path = path_util::toLower(path);
  parts.filename = path_util::toLower(filename);
  parts.exact_filename = std::string(filename);
  parts.extension = path_util::toLower(extension);

  parts.dir_segments = path_util::splitSegments(parts.path);
  if (!parts.dir_segments.empty()) parts.dir_segments.pop_back();  // filename

  for (const auto& rule : rules_.rules) {
    if (ruleMatches(rule, parts)) return rule.cls;
  }
  return FileClass::Source;
}

FileClass Classifier::classifyPath(std::string_view path) const {
  return classify(path, path_util::filename(path), path_util::extension(path));
}

}  // namespace dirstat
