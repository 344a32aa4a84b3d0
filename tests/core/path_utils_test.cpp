// Tests for core/path_utils.h -- repository-relative path helpers.

#include "core/path_utils.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace dirstat {
namespace {

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

TEST(PathUtilsTest, AcceptsNormalizedRelativePaths) {
  EXPECT_TRUE(path_util::isValidRelativePath("a.py", nullptr));
  EXPECT_TRUE(path_util::isValidRelativePath("src/lib/c.py", nullptr));
  EXPECT_TRUE(path_util::isValidRelativePath(".github/workflows/ci.yml", nullptr));
  EXPECT_TRUE(path_util::isValidRelativePath("a..b/c", nullptr));
}

TEST(PathUtilsTest, RejectsInvalidPaths) {
  struct Case {
    const char* path;
    const char* reason;
  };
  const Case cases[] = {
      {"", "empty path"},
      {"/etc/passwd", "absolute path"},
      {"src/", "trailing separator"},
      {"src\\a.py", "backslash separator"},
      {"src//a.py", "empty path segment"},
      {"../a.py", "parent directory segment"},
      {"src/../a.py", "parent directory segment"},
      {"./a.py", "current directory segment"},
  };
  for (const auto& test_case : cases) {
    std::string reason;
    EXPECT_FALSE(path_util::isValidRelativePath(test_case.path, &reason)) << test_case.path;
    EXPECT_EQ(reason, test_case.reason) << test_case.path;
  }
}

// ---------------------------------------------------------------------------
// Components
// ---------------------------------------------------------------------------

TEST(PathUtilsTest, ParentDirectory) {
  EXPECT_EQ(path_util::parentDirectory("a.py"), "/");
  EXPECT_EQ(path_util::parentDirectory("src/b.py"), "src");
  EXPECT_EQ(path_util::parentDirectory("src/lib/c.py"), "src/lib");
}

TEST(PathUtilsTest, FilenameAndExtension) {
  EXPECT_EQ(path_util::filename("src/lib/c.py"), "c.py");
  EXPECT_EQ(path_util::filename("Makefile"), "Makefile");
  EXPECT_EQ(path_util::extension("src/lib/c.py"), ".py");
  EXPECT_EQ(path_util::extension("dist/app.min.js"), ".js");
  EXPECT_EQ(path_util::extension("Makefile"), "");
  EXPECT_EQ(path_util::extension(".gitignore"), "");
  EXPECT_EQ(path_util::extension("dir.d/file"), "");
  EXPECT_EQ(path_util::extension("trailing."), "");
}

TEST(PathUtilsTest, SegmentsAndDepth) {
  EXPECT_TRUE(path_util::splitSegments("/").empty());
  EXPECT_EQ(path_util::splitSegments("src/lib"), (std::vector<std::string>{"src", "lib"}));
  EXPECT_EQ(path_util::directoryDepth("/"), 0);
  EXPECT_EQ(path_util::directoryDepth("src"), 1);
  EXPECT_EQ(path_util::directoryDepth("src/lib"), 2);
}

TEST(PathUtilsTest, AncestorsNearestFirst) {
  EXPECT_TRUE(path_util::ancestors("/").empty());
  EXPECT_EQ(path_util::ancestors("src"), (std::vector<std::string>{"/"}));
  EXPECT_EQ(path_util::ancestors("src/lib/deep"),
            (std::vector<std::string>{"src/lib", "src", "/"}));
}

// ---------------------------------------------------------------------------
// Ordering
// ---------------------------------------------------------------------------

TEST(PathUtilsTest, DirectoryLessPutsRootFirst) {
  std::vector<std::string> paths = {"src/lib", "/", "docs", "src", ".github"};
  std::sort(paths.begin(), paths.end(), path_util::directoryLess);
  EXPECT_EQ(paths, (std::vector<std::string>{"/", ".github", "docs", "src", "src/lib"}));
  EXPECT_FALSE(path_util::directoryLess("/", "/"));
}

TEST(PathUtilsTest, ToLower) {
  EXPECT_EQ(path_util::toLower("CMakeLists.TXT"), "cmakelists.txt");
}

}  // namespace
}  // namespace dirstat
