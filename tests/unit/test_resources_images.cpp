#include <gtest/gtest.h>
#include "config/config_schema.hpp"
#include "sandbox/images.hpp"
#include "sandbox/resources.hpp"

namespace {

using runbox::sandbox::CpuNanoQuota;
using runbox::sandbox::GetImage;
using runbox::sandbox::ParseCpu;
using runbox::sandbox::ParseMemory;
using runbox::sandbox::SplitImageReference;
using runbox::workspace::ProjectType;

TEST(ResourcesTest, ParsesMemorySuffixes) {
    EXPECT_EQ(ParseMemory("1g"), 1073741824);
    EXPECT_EQ(ParseMemory("512m"), 536870912);
    EXPECT_EQ(ParseMemory("64k"), 65536);
    EXPECT_EQ(ParseMemory("2G"), 2147483648);
    EXPECT_EQ(ParseMemory(" 256M "), 268435456);
    EXPECT_EQ(ParseMemory("1048576"), 1048576);
}

TEST(ResourcesTest, InvalidMemoryFallsBackToOneGiB) {
    EXPECT_EQ(ParseMemory(""), 1073741824);
    EXPECT_EQ(ParseMemory("lots"), 1073741824);
    EXPECT_EQ(ParseMemory("g"), 1073741824);
    EXPECT_EQ(ParseMemory("12x"), 1073741824);
    EXPECT_EQ(ParseMemory("-1g"), 1073741824);
    EXPECT_EQ(ParseMemory("0m"), 1073741824);
}

TEST(ResourcesTest, ParsesCpuCount) {
    EXPECT_DOUBLE_EQ(ParseCpu("4"), 4.0);
    EXPECT_DOUBLE_EQ(ParseCpu("1.5"), 1.5);
    EXPECT_DOUBLE_EQ(ParseCpu(""), 2.0);
    EXPECT_DOUBLE_EQ(ParseCpu("0"), 2.0);
    EXPECT_DOUBLE_EQ(ParseCpu("-3"), 2.0);
    EXPECT_DOUBLE_EQ(ParseCpu("two"), 2.0);
    EXPECT_DOUBLE_EQ(ParseCpu("1.5cores"), 2.0);
}

TEST(ResourcesTest, CpuQuotaUsesWholeCores) {
    EXPECT_EQ(CpuNanoQuota(2.0), 2'000'000'000LL);
    EXPECT_EQ(CpuNanoQuota(1.5), 1'000'000'000LL);
    EXPECT_EQ(CpuNanoQuota(0.5), 1'000'000'000LL);
}

TEST(ImagesTest, MapsProjectTypesToMinimalImages) {
    const runbox::config::RunnerConfig config{};
    EXPECT_EQ(GetImage(ProjectType::kGo, config), "golang:alpine");
    EXPECT_EQ(GetImage(ProjectType::kNode, config), "node:alpine");
    EXPECT_EQ(GetImage(ProjectType::kPython, config), "python:alpine");
    EXPECT_EQ(GetImage(ProjectType::kRust, config), "rust:alpine");
    EXPECT_EQ(GetImage(ProjectType::kUnknown, config), "alpine:latest");
}

TEST(ImagesTest, OverrideAlwaysWins) {
    runbox::config::RunnerConfig config{};
    config.image_override = "registry.local:5000/tools/ci:7";
    EXPECT_EQ(GetImage(ProjectType::kGo, config), "registry.local:5000/tools/ci:7");
    EXPECT_EQ(GetImage(ProjectType::kUnknown, config), "registry.local:5000/tools/ci:7");
}

TEST(ImagesTest, SplitsImageReferences) {
    EXPECT_EQ(SplitImageReference("golang:alpine"), std::make_pair(std::string("golang"), std::string("alpine")));
    EXPECT_EQ(SplitImageReference("ubuntu"), std::make_pair(std::string("ubuntu"), std::string("latest")));
    EXPECT_EQ(SplitImageReference("registry.local:5000/tools/ci"),
              std::make_pair(std::string("registry.local:5000/tools/ci"), std::string("latest")));
    EXPECT_EQ(SplitImageReference("registry.local:5000/tools/ci:7"),
              std::make_pair(std::string("registry.local:5000/tools/ci"), std::string("7")));
    EXPECT_EQ(SplitImageReference("alpine@sha256:abc"),
              std::make_pair(std::string("alpine"), std::string("sha256:abc")));
}

}  // namespace
