#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::config {
namespace {

constexpr const char* kLogTag = "config";

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyTimeout(RunnerConfig& config, const std::string& value, const char* source) {
    const auto parsed = ParseDuration(value);
    if (parsed && parsed->count() > 0) {
        config.default_timeout = *parsed;
        return;
    }
    utils::LogWarn(kLogTag, std::string("Invalid ") + source + " value '" + value +
                                "', using default 2m");
    config.default_timeout = kDefaultCmdTimeout;
}

void ApplyConfigFromJson(RunnerConfig& config, const nlohmann::json& data) {
    if (!data.is_object() || !data.contains("sandbox") || !data["sandbox"].is_object()) {
        return;
    }
    const auto& sandbox = data["sandbox"];
    if (sandbox.contains("mode") && sandbox["mode"].is_string()) {
        config.mode = ParseMode(sandbox["mode"].get<std::string>());
    }
    if (sandbox.contains("image") && sandbox["image"].is_string()) {
        config.image_override = sandbox["image"].get<std::string>();
    }
    if (sandbox.contains("cpu")) {
        if (sandbox["cpu"].is_string()) {
            config.cpu_limit = sandbox["cpu"].get<std::string>();
        } else if (sandbox["cpu"].is_number()) {
            config.cpu_limit = sandbox["cpu"].dump();
        }
    }
    if (sandbox.contains("memory") && sandbox["memory"].is_string()) {
        config.memory_limit = sandbox["memory"].get<std::string>();
    }
    if (sandbox.contains("cmdTimeout")) {
        if (sandbox["cmdTimeout"].is_string()) {
            ApplyTimeout(config, sandbox["cmdTimeout"].get<std::string>(), "sandbox.cmdTimeout");
        } else if (sandbox["cmdTimeout"].is_number_integer()) {
            ApplyTimeout(config, sandbox["cmdTimeout"].dump(), "sandbox.cmdTimeout");
        }
    }
    if (sandbox.contains("dockerHost") && sandbox["dockerHost"].is_string()) {
        config.docker_host = sandbox["dockerHost"].get<std::string>();
    }
}

}  // namespace

const char* ToString(Mode mode) {
    switch (mode) {
        case Mode::kContainer: return "docker";
        case Mode::kHost: return "host";
        case Mode::kAuto: return "auto";
    }
    return "auto";
}

Mode ParseMode(const std::string& value) {
    const auto lowered = utils::ToLower(utils::Trim(value));
    if (lowered.empty() || lowered == "auto") {
        return Mode::kAuto;
    }
    if (lowered == "docker" || lowered == "container") {
        return Mode::kContainer;
    }
    if (lowered == "host") {
        return Mode::kHost;
    }
    utils::LogWarn(kLogTag, "Unknown sandbox mode value '" + value + "', defaulting to 'auto'");
    return Mode::kAuto;
}

std::optional<std::chrono::milliseconds> ParseDuration(const std::string& value) {
    const auto text = utils::Trim(value);
    if (text.empty()) {
        return std::nullopt;
    }
    const bool bare_number = std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
    if (bare_number) {
        std::int64_t seconds = 0;
        try {
            seconds = std::stoll(text);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
        if (seconds > std::numeric_limits<std::int64_t>::max() / 1000) {
            return std::nullopt;
        }
        return std::chrono::seconds(seconds);
    }

    double total_ms = 0.0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto number_start = pos;
        while (pos < text.size() &&
               (std::isdigit(static_cast<unsigned char>(text[pos])) || text[pos] == '.')) {
            ++pos;
        }
        if (pos == number_start) {
            return std::nullopt;
        }
        const auto number = text.substr(number_start, pos - number_start);
        double amount = 0.0;
        std::size_t consumed = 0;
        try {
            amount = std::stod(number, &consumed);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (consumed != number.size()) {
            return std::nullopt;
        }
        const auto unit_start = pos;
        while (pos < text.size() && std::isalpha(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        const auto unit = text.substr(unit_start, pos - unit_start);
        if (unit == "ms") {
            total_ms += amount;
        } else if (unit == "s") {
            total_ms += amount * 1000.0;
        } else if (unit == "m") {
            total_ms += amount * 60.0 * 1000.0;
        } else if (unit == "h") {
            total_ms += amount * 3600.0 * 1000.0;
        } else {
            return std::nullopt;
        }
    }
    // 2^63 is exactly representable, so anything at or above it cannot be cast back.
    if (!std::isfinite(total_ms) ||
        total_ms >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(total_ms));
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".runbox" / "config.json";
}

RunnerConfig ResolveRunnerConfig(const EnvLookup& env, const nlohmann::json& file) {
    RunnerConfig config{};

    const auto docker_host = env("DOCKER_HOST");
    if (!docker_host.empty()) {
        config.docker_host = docker_host;
    }

    ApplyConfigFromJson(config, file);

    const auto mode = env("RUNBOX_SANDBOX_MODE");
    if (!mode.empty()) {
        config.mode = ParseMode(mode);
    }

    const auto image = env("RUNBOX_DOCKER_IMAGE");
    if (!image.empty()) {
        config.image_override = image;
    }

    const auto cpu = env("RUNBOX_DOCKER_CPU");
    if (!cpu.empty()) {
        config.cpu_limit = cpu;
    }

    const auto memory = env("RUNBOX_DOCKER_MEMORY");
    if (!memory.empty()) {
        config.memory_limit = memory;
    }

    const auto timeout = env("RUNBOX_CMD_TIMEOUT");
    if (!timeout.empty()) {
        ApplyTimeout(config, timeout, "RUNBOX_CMD_TIMEOUT");
    }

    return config;
}

RunnerConfig LoadRunnerConfig() {
    nlohmann::json data = nlohmann::json::object();
    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            utils::LogWarn(kLogTag, "Failed to parse " + config_path.string() + ", keeping defaults");
            data = nlohmann::json::object();
        }
    }
    return ResolveRunnerConfig(GetEnv, data);
}

}  // namespace runbox::config
