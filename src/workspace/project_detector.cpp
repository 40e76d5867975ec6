#include "workspace/project_detector.hpp"

#include <array>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "utils/common.hpp"

namespace runbox::workspace {
namespace {

constexpr int kMinExtensionCount = 3;

const std::array<std::pair<const char*, ProjectType>, 5> kManifests = {{
    {"go.mod", ProjectType::kGo},
    {"package.json", ProjectType::kNode},
    {"pyproject.toml", ProjectType::kPython},
    {"requirements.txt", ProjectType::kPython},
    {"Cargo.toml", ProjectType::kRust},
}};

ProjectType TypeForExtension(const std::string& extension) {
    static const std::unordered_map<std::string, ProjectType> kExtensions = {
        {".go", ProjectType::kGo},
        {".ts", ProjectType::kNode},
        {".tsx", ProjectType::kNode},
        {".js", ProjectType::kNode},
        {".jsx", ProjectType::kNode},
        {".py", ProjectType::kPython},
        {".rs", ProjectType::kRust},
    };
    const auto it = kExtensions.find(extension);
    return it == kExtensions.end() ? ProjectType::kUnknown : it->second;
}

}  // namespace

const char* ToString(ProjectType type) {
    switch (type) {
        case ProjectType::kGo: return "go";
        case ProjectType::kNode: return "node";
        case ProjectType::kPython: return "python";
        case ProjectType::kRust: return "rust";
        case ProjectType::kUnknown: return "unknown";
    }
    return "unknown";
}

ProjectType DetectProjectType(const std::filesystem::path& repo_root) {
    std::error_code ec;
    for (const auto& [manifest, type] : kManifests) {
        if (std::filesystem::exists(repo_root / manifest, ec)) {
            return type;
        }
    }

    std::filesystem::directory_iterator it(repo_root, ec);
    if (ec) {
        return ProjectType::kUnknown;
    }

    std::unordered_map<ProjectType, int> counts;
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const auto type = TypeForExtension(utils::ToLower(entry.path().extension().string()));
        if (type != ProjectType::kUnknown) {
            ++counts[type];
        }
    }

    int max_count = 0;
    auto detected = ProjectType::kUnknown;
    for (const auto type : {ProjectType::kGo, ProjectType::kNode, ProjectType::kPython, ProjectType::kRust}) {
        const int count = counts[type];
        if (count > max_count) {
            max_count = count;
            detected = type;
        } else if (count == max_count && count > 0) {
            detected = ProjectType::kUnknown;
        }
    }

    if (max_count < kMinExtensionCount) {
        return ProjectType::kUnknown;
    }
    return detected;
}

std::optional<ProjectCommand> GetLintCommand(ProjectType type) {
    switch (type) {
        case ProjectType::kGo: return ProjectCommand{"gofmt", {"-l", "."}};
        case ProjectType::kNode: return ProjectCommand{"npm", {"run", "lint"}};
        case ProjectType::kPython: return ProjectCommand{"ruff", {"check", "."}};
        case ProjectType::kRust: return ProjectCommand{"cargo", {"clippy", "--", "-D", "warnings"}};
        case ProjectType::kUnknown: break;
    }
    return std::nullopt;
}

std::optional<ProjectCommand> GetBuildCommand(ProjectType type) {
    switch (type) {
        case ProjectType::kGo: return ProjectCommand{"go", {"build", "./..."}};
        case ProjectType::kNode: return ProjectCommand{"npm", {"run", "build"}};
        case ProjectType::kRust: return ProjectCommand{"cargo", {"build"}};
        // Python projects have no build step.
        case ProjectType::kPython:
        case ProjectType::kUnknown: break;
    }
    return std::nullopt;
}

std::optional<ProjectCommand> GetTestCommand(ProjectType type) {
    switch (type) {
        case ProjectType::kGo: return ProjectCommand{"go", {"test", "./..."}};
        case ProjectType::kNode: return ProjectCommand{"npm", {"test"}};
        case ProjectType::kPython: return ProjectCommand{"pytest", {}};
        case ProjectType::kRust: return ProjectCommand{"cargo", {"test"}};
        case ProjectType::kUnknown: break;
    }
    return std::nullopt;
}

}  // namespace runbox::workspace
