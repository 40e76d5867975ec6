#pragma once

#include <chrono>
#include <string>

namespace runbox::config {

enum class Mode {
    kContainer,
    kHost,
    kAuto
};

const char* ToString(Mode mode);

inline constexpr std::chrono::milliseconds kDefaultCmdTimeout = std::chrono::minutes(2);
inline constexpr const char* kDefaultCpuLimit = "2";
inline constexpr const char* kDefaultMemoryLimit = "1g";
inline constexpr const char* kDefaultDockerHost = "unix:///var/run/docker.sock";

// Built once per process and shared read-only by every runner.
struct RunnerConfig {
    Mode mode = Mode::kAuto;
    std::string image_override;
    std::string cpu_limit = kDefaultCpuLimit;
    std::string memory_limit = kDefaultMemoryLimit;
    std::chrono::milliseconds default_timeout = kDefaultCmdTimeout;
    std::string docker_host = kDefaultDockerHost;
    std::chrono::milliseconds probe_timeout = std::chrono::seconds(5);
    std::chrono::milliseconds cleanup_timeout = std::chrono::seconds(5);
    std::chrono::milliseconds pull_timeout = std::chrono::minutes(10);
    std::chrono::milliseconds kill_grace = std::chrono::seconds(2);
};

}  // namespace runbox::config
