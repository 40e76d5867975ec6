#include <gtest/gtest.h>
#include "test_support.hpp"
#include "workspace/project_detector.hpp"

namespace {

using runbox::testing::TempDir;
using runbox::testing::WriteFile;
using runbox::workspace::DetectProjectType;
using runbox::workspace::ProjectType;

void WriteFiles(const std::filesystem::path& dir, const std::string& extension, int count) {
    for (int i = 0; i < count; ++i) {
        WriteFile(dir / ("file" + std::to_string(i) + extension), "x");
    }
}

TEST(ProjectDetectorTest, ManifestWinsOverExtensionCounts) {
    TempDir repo;
    WriteFile(repo.path() / "go.mod", "module example.com/demo\n");
    WriteFiles(repo.path(), ".py", 5);
    EXPECT_EQ(DetectProjectType(repo.path()), ProjectType::kGo);
}

TEST(ProjectDetectorTest, ManifestPriorityOrder) {
    TempDir repo;
    WriteFile(repo.path() / "requirements.txt", "pytest\n");
    WriteFile(repo.path() / "package.json", "{}");
    EXPECT_EQ(DetectProjectType(repo.path()), ProjectType::kNode);
}

TEST(ProjectDetectorTest, DetectsEachManifest) {
    const std::vector<std::pair<std::string, ProjectType>> cases = {
        {"go.mod", ProjectType::kGo},
        {"package.json", ProjectType::kNode},
        {"pyproject.toml", ProjectType::kPython},
        {"requirements.txt", ProjectType::kPython},
        {"Cargo.toml", ProjectType::kRust},
    };
    for (const auto& [manifest, expected] : cases) {
        TempDir repo;
        WriteFile(repo.path() / manifest);
        EXPECT_EQ(DetectProjectType(repo.path()), expected) << manifest;
    }
}

TEST(ProjectDetectorTest, FallsBackToExtensionCount) {
    TempDir repo;
    WriteFiles(repo.path(), ".py", 5);
    WriteFiles(repo.path(), ".go", 1);
    EXPECT_EQ(DetectProjectType(repo.path()), ProjectType::kPython);
}

TEST(ProjectDetectorTest, CountsNodeExtensionsTogether) {
    TempDir repo;
    WriteFile(repo.path() / "a.ts");
    WriteFile(repo.path() / "b.tsx");
    WriteFile(repo.path() / "c.JS");
    EXPECT_EQ(DetectProjectType(repo.path()), ProjectType::kNode);
}

TEST(ProjectDetectorTest, BelowThresholdIsUnknown) {
    TempDir repo;
    WriteFiles(repo.path(), ".rs", 2);
    EXPECT_EQ(DetectProjectType(repo.path()), ProjectType::kUnknown);
}

TEST(ProjectDetectorTest, TieIsUnknown) {
    TempDir repo;
    WriteFiles(repo.path(), ".go", 3);
    WriteFiles(repo.path(), ".py", 3);
    EXPECT_EQ(DetectProjectType(repo.path()), ProjectType::kUnknown);
}

TEST(ProjectDetectorTest, DoesNotRecurse) {
    TempDir repo;
    WriteFiles(repo.path() / "src", ".py", 6);
    EXPECT_EQ(DetectProjectType(repo.path()), ProjectType::kUnknown);
}

TEST(ProjectDetectorTest, MissingDirectoryIsUnknown) {
    EXPECT_EQ(DetectProjectType("/nonexistent/runbox/repo"), ProjectType::kUnknown);
}

TEST(ProjectDetectorTest, SuggestsProjectCommands) {
    const auto go_test = runbox::workspace::GetTestCommand(ProjectType::kGo);
    ASSERT_TRUE(go_test.has_value());
    EXPECT_EQ(go_test->executable, "go");
    EXPECT_EQ(go_test->args, (std::vector<std::string>{"test", "./..."}));

    const auto rust_lint = runbox::workspace::GetLintCommand(ProjectType::kRust);
    ASSERT_TRUE(rust_lint.has_value());
    EXPECT_EQ(rust_lint->executable, "cargo");
    EXPECT_EQ(rust_lint->args, (std::vector<std::string>{"clippy", "--", "-D", "warnings"}));

    EXPECT_FALSE(runbox::workspace::GetBuildCommand(ProjectType::kPython).has_value());
    EXPECT_FALSE(runbox::workspace::GetTestCommand(ProjectType::kUnknown).has_value());
    EXPECT_STREQ(runbox::workspace::ToString(ProjectType::kNode), "node");
}

}  // namespace
