#pragma once

#include <string>
#include <utility>

#include "config/config_schema.hpp"
#include "workspace/project_detector.hpp"

namespace runbox::sandbox {

inline constexpr const char* kFallbackImage = "alpine:latest";

// A configured override always wins; otherwise a minimal image per language.
std::string GetImage(workspace::ProjectType type, const config::RunnerConfig& config);

// Splits "registry:5000/name:tag" into repository and tag (default "latest").
// Digest references keep the digest as the tag component.
std::pair<std::string, std::string> SplitImageReference(const std::string& reference);

}  // namespace runbox::sandbox
