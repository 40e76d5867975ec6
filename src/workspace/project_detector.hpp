#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace runbox::workspace {

enum class ProjectType {
    kGo,
    kNode,
    kPython,
    kRust,
    kUnknown
};

const char* ToString(ProjectType type);

struct ProjectCommand {
    std::string executable;
    std::vector<std::string> args;
};

// Manifest files decide first. Without one, the most common source extension in the
// repository root wins, provided it appears at least three times.
ProjectType DetectProjectType(const std::filesystem::path& repo_root);

std::optional<ProjectCommand> GetLintCommand(ProjectType type);
std::optional<ProjectCommand> GetBuildCommand(ProjectType type);
std::optional<ProjectCommand> GetTestCommand(ProjectType type);

}  // namespace runbox::workspace
