// Tests for tree/classifier.h -- path-based file classification.

#include "tree/classifier.h"

#include <gtest/gtest.h>

#include <string>

namespace dirstat {
namespace {

FileClass classifyDefault(const std::string& path) {
  static const Classifier classifier;
  return classifier.classifyPath(path);
}

// ---------------------------------------------------------------------------
// Default rules
// ---------------------------------------------------------------------------

TEST(ClassifierTest, SourceWhenNothingMatches) {
  EXPECT_EQ(classifyDefault("src/main.py"), FileClass::Source);
  EXPECT_EQ(classifyDefault("a.py"), FileClass::Source);
  EXPECT_EQ(classifyDefault("latest/contest.py"), FileClass::Source);
}

TEST(ClassifierTest, CiPaths) {
  EXPECT_EQ(classifyDefault(".github/workflows/ci.yml"), FileClass::Ci);
  EXPECT_EQ(classifyDefault("tools/.circleci/config.yml"), FileClass::Ci);
  EXPECT_EQ(classifyDefault("Jenkinsfile"), FileClass::Ci);
  EXPECT_EQ(classifyDefault(".gitlab-ci.yml"), FileClass::Ci);
  EXPECT_EQ(classifyDefault(".travis.yml"), FileClass::Ci);
}

TEST(ClassifierTest, CiMarkerMustStartAtSegmentBoundary) {
  // "x.github/workflows/" is not a .github directory.
  EXPECT_NE(classifyDefault("x.github/workflows/run.py"), FileClass::Ci);
}

TEST(ClassifierTest, BuildFiles) {
  EXPECT_EQ(classifyDefault("Makefile"), FileClass::Build);
  EXPECT_EQ(classifyDefault("CMakeLists.txt"), FileClass::Build);
  EXPECT_EQ(classifyDefault("app/pom.xml"), FileClass::Build);
  EXPECT_EQ(classifyDefault("app/build.gradle.kts"), FileClass::Build);
  EXPECT_EQ(classifyDefault("App.sln"), FileClass::Build);
  EXPECT_EQ(classifyDefault("src/App.csproj"), FileClass::Build);
}

TEST(ClassifierTest, TestFiles) {
  EXPECT_EQ(classifyDefault("tests/conftest.py"), FileClass::Test);
  EXPECT_EQ(classifyDefault("pkg/__tests__/app.js"), FileClass::Test);
  EXPECT_EQ(classifyDefault("src/test_parser.py"), FileClass::Test);
  EXPECT_EQ(classifyDefault("src/parser_test.go"), FileClass::Test);
  EXPECT_EQ(classifyDefault("web/app.test.ts"), FileClass::Test);
  EXPECT_EQ(classifyDefault("web/app.spec.ts"), FileClass::Test);
  EXPECT_EQ(classifyDefault("src/ParserTest.java"), FileClass::Test);
  EXPECT_EQ(classifyDefault("src/ParserTests.cs"), FileClass::Test);
}

TEST(ClassifierTest, CamelCaseTestSuffixIsCaseSensitive) {
  EXPECT_EQ(classifyDefault("src/Latest.java"), FileClass::Source);
}

TEST(ClassifierTest, ConfigFiles) {
  EXPECT_EQ(classifyDefault("package.json"), FileClass::Config);
  EXPECT_EQ(classifyDefault("pyproject.toml"), FileClass::Config);
  EXPECT_EQ(classifyDefault("go.mod"), FileClass::Config);
  EXPECT_EQ(classifyDefault("web/vite.config.ts"), FileClass::Config);
  EXPECT_EQ(classifyDefault(".env.local"), FileClass::Config);
  EXPECT_EQ(classifyDefault("deploy/values.yaml"), FileClass::Config);
  EXPECT_EQ(classifyDefault("app/settings.py"), FileClass::Config);
}

TEST(ClassifierTest, DocsFiles) {
  EXPECT_EQ(classifyDefault("README.md"), FileClass::Docs);
  EXPECT_EQ(classifyDefault("docs/conf.py"), FileClass::Docs);
  EXPECT_EQ(classifyDefault("documentation/guide.html"), FileClass::Docs);
  EXPECT_EQ(classifyDefault("NOTES.txt"), FileClass::Docs);
}

// ---------------------------------------------------------------------------
// Precedence
// ---------------------------------------------------------------------------

TEST(ClassifierTest, CiBeatsConfig) {
  // .yml alone would be config.
  EXPECT_EQ(classifyDefault(".github/workflows/release.yaml"), FileClass::Ci);
}

TEST(ClassifierTest, BuildBeatsDocsAndTest) {
  EXPECT_EQ(classifyDefault("docs/CMakeLists.txt"), FileClass::Build);
  EXPECT_EQ(classifyDefault("tests/Makefile"), FileClass::Build);
}

TEST(ClassifierTest, TestBeatsConfigAndDocs) {
  EXPECT_EQ(classifyDefault("tests/fixtures/data.yaml"), FileClass::Test);
  EXPECT_EQ(classifyDefault("tests/README.md"), FileClass::Test);
}

TEST(ClassifierTest, ConfigBeatsDocs) {
  EXPECT_EQ(classifyDefault("requirements.txt"), FileClass::Config);
}

// ---------------------------------------------------------------------------
// Custom rule tables
// ---------------------------------------------------------------------------

TEST(ClassifierTest, CustomRuleTable) {
  ClassRule vendored;
  vendored.cls = FileClass::Config;
  vendored.dir_names = {"vendor"};
  ClassificationRules rules;
  rules.rules.push_back(vendored);

  Classifier classifier(rules);
  EXPECT_EQ(classifier.classifyPath("vendor/lib.go"), FileClass::Config);
  // Defaults are not merged in.
  EXPECT_EQ(classifier.classifyPath("tests/a_test.go"), FileClass::Source);
  EXPECT_EQ(classifier.rules().rules.size(), 1u);
}

TEST(ClassifierTest, ExplicitComponentsOverload) {
  Classifier classifier;
  EXPECT_EQ(classifier.classify("x/y/Makefile", "Makefile", ""), FileClass::Build);
  EXPECT_EQ(classifier.classify("x/y/notes.md", "notes.md", ".md"), FileClass::Docs);
}

TEST(ClassifierTest, DefaultTableOrder) {
  ClassificationRules rules = ClassificationRules::defaults();
  ASSERT_EQ(rules.rules.size(), 5u);
  EXPECT_EQ(rules.rules[0].cls, FileClass::Ci);
  EXPECT_EQ(rules.rules[1].cls, FileClass::Build);
  EXPECT_EQ(rules.rules[2].cls, FileClass::Test);
  EXPECT_EQ(rules.rules[3].cls, FileClass::Config);
  EXPECT_EQ(rules.rules[4].cls, FileClass::Docs);
}

}  // namespace
}  // namespace dirstat
