#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace runbox::config {

using EnvLookup = std::function<std::string(const char*)>;

// Unknown values log a warning and resolve to Mode::kAuto.
Mode ParseMode(const std::string& value);

// Accepts Go-style durations ("90s", "2m", "1m30s", "500ms", "1h") or a bare
// number of seconds. Returns nullopt for malformed input.
std::optional<std::chrono::milliseconds> ParseDuration(const std::string& value);

std::filesystem::path GetConfigPath();

// Defaults, then the "sandbox" object of `file` (may be null), then the environment.
RunnerConfig ResolveRunnerConfig(const EnvLookup& env, const nlohmann::json& file);

// ResolveRunnerConfig over ~/.runbox/config.json and the process environment.
RunnerConfig LoadRunnerConfig();

}  // namespace runbox::config
