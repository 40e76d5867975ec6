#include "sandbox/images.hpp"

namespace runbox::sandbox {

std::string GetImage(workspace::ProjectType type, const config::RunnerConfig& config) {
    if (!config.image_override.empty()) {
        return config.image_override;
    }
    switch (type) {
        case workspace::ProjectType::kGo: return "golang:alpine";
        case workspace::ProjectType::kNode: return "node:alpine";
        case workspace::ProjectType::kPython: return "python:alpine";
        case workspace::ProjectType::kRust: return "rust:alpine";
        case workspace::ProjectType::kUnknown: break;
    }
    return kFallbackImage;
}

std::pair<std::string, std::string> SplitImageReference(const std::string& reference) {
    const auto at = reference.find('@');
    if (at != std::string::npos) {
        return {reference.substr(0, at), reference.substr(at + 1)};
    }
    const auto colon = reference.rfind(':');
    const auto slash = reference.rfind('/');
    // A colon before the last slash belongs to a registry port.
    if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
        return {reference, "latest"};
    }
    return {reference.substr(0, colon), reference.substr(colon + 1)};
}

}  // namespace runbox::sandbox
