#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/container_backend.hpp"
#include "sandbox/runner.hpp"

namespace runbox::sandbox {

using BackendProvider =
    std::function<std::shared_ptr<ContainerBackend>(const config::RunnerConfig&)>;

// Builds a DockerClient for config.docker_host.
std::shared_ptr<ContainerBackend> MakeDockerBackend(const config::RunnerConfig& config);

// Chooses a runner for the configured mode. Container and auto modes probe the
// backend and fall back to the host runner when it is unavailable.
class RunnerFactory {
public:
    explicit RunnerFactory(config::RunnerConfig config,
                           BackendProvider provider = MakeDockerBackend);

    // Never throws; the host runner is the guaranteed fallback.
    std::shared_ptr<Runner> NewRunner() const;

    // Probe-free selection: kContainer or kHost. kAuto throws kInvalidArgument,
    // an unreachable backend throws kBackendUnavailable.
    std::shared_ptr<Runner> NewRunner(config::Mode mode) const;

    bool IsContainerBackendAvailable() const;

private:
    std::shared_ptr<ContainerBackend> MakeBackend() const;
    std::shared_ptr<Runner> NewContainerOrFallback(bool explicit_request) const;

    config::RunnerConfig config_;
    BackendProvider provider_;
};

std::shared_ptr<Runner> NewRunner(const config::RunnerConfig& config);
std::shared_ptr<Runner> NewRunner(config::Mode mode, const config::RunnerConfig& config);
bool IsContainerBackendAvailable(const config::RunnerConfig& config);

// Process-wide runner, resolved from LoadRunnerConfig() on first use.
Runner& DefaultRunner();

// Runs a command with DefaultRunner().
Result RunCmd(const Context& ctx,
              const std::string& repo_dir,
              const std::string& executable,
              const std::vector<std::string>& args,
              std::chrono::milliseconds timeout);

}  // namespace runbox::sandbox
