#include "sandbox/runner_factory.hpp"

#include "config/config_loader.hpp"
#include "docker/docker_client.hpp"
#include "sandbox/container_runner.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/host_runner.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace {

constexpr const char* kLogTag = "sandbox";

}  // namespace

std::shared_ptr<ContainerBackend> MakeDockerBackend(const config::RunnerConfig& config) {
    return std::make_shared<docker::DockerClient>(
        config.docker_host, std::chrono::seconds(30), config.pull_timeout);
}

RunnerFactory::RunnerFactory(config::RunnerConfig config, BackendProvider provider)
    : config_(std::move(config)), provider_(std::move(provider)) {}

std::shared_ptr<ContainerBackend> RunnerFactory::MakeBackend() const {
    if (!provider_) {
        throw SandboxError(ErrorKind::kBackendUnavailable, "no container backend configured");
    }
    auto backend = provider_(config_);
    if (!backend) {
        throw SandboxError(ErrorKind::kBackendUnavailable, "container backend provider returned nothing");
    }
    return backend;
}

bool RunnerFactory::IsContainerBackendAvailable() const {
    try {
        MakeBackend()->Ping(config_.probe_timeout);
        return true;
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kDebug, kLogTag, "container backend probe failed",
                   {{"error", ex.what()}});
        return false;
    }
}

std::shared_ptr<Runner> RunnerFactory::NewContainerOrFallback(bool explicit_request) const {
    if (!IsContainerBackendAvailable()) {
        if (explicit_request) {
            utils::LogWarn(kLogTag,
                           "Docker mode requested but Docker is not available. "
                           "Falling back to host executor (NO ISOLATION).");
        } else {
            utils::LogWarn(kLogTag,
                           "Docker not available. Using host executor (no sandboxing).");
        }
        return std::make_shared<HostRunner>(config_);
    }
    try {
        return std::make_shared<ContainerRunner>(config_, MakeBackend());
    } catch (const std::exception& ex) {
        utils::LogWarn(kLogTag, std::string("Failed to create Docker runner: ") + ex.what() +
                                    ". Falling back to host executor (NO ISOLATION).");
        return std::make_shared<HostRunner>(config_);
    }
}

std::shared_ptr<Runner> RunnerFactory::NewRunner() const {
    switch (config_.mode) {
        case config::Mode::kContainer:
            return NewContainerOrFallback(true);
        case config::Mode::kHost:
            utils::LogWarn(kLogTag,
                           "Using host executor (no sandboxing). This is insecure and should "
                           "only be used for development.");
            return std::make_shared<HostRunner>(config_);
        case config::Mode::kAuto:
            return NewContainerOrFallback(false);
    }
    utils::LogWarn(kLogTag, "Unknown sandbox mode, treating as auto.");
    return NewContainerOrFallback(false);
}

std::shared_ptr<Runner> RunnerFactory::NewRunner(config::Mode mode) const {
    switch (mode) {
        case config::Mode::kContainer:
            return std::make_shared<ContainerRunner>(config_, MakeBackend());
        case config::Mode::kHost:
            return std::make_shared<HostRunner>(config_);
        case config::Mode::kAuto:
            break;
    }
    throw SandboxError(ErrorKind::kInvalidArgument,
                       std::string("unknown runner mode: ") + config::ToString(mode));
}

std::shared_ptr<Runner> NewRunner(const config::RunnerConfig& config) {
    return RunnerFactory(config).NewRunner();
}

std::shared_ptr<Runner> NewRunner(config::Mode mode, const config::RunnerConfig& config) {
    return RunnerFactory(config).NewRunner(mode);
}

bool IsContainerBackendAvailable(const config::RunnerConfig& config) {
    return RunnerFactory(config).IsContainerBackendAvailable();
}

Runner& DefaultRunner() {
    static const std::shared_ptr<Runner> runner = [] {
        const auto config = config::LoadRunnerConfig();
        auto selected = NewRunner(config);
        utils::Log(utils::LogLevel::kInfo, kLogTag, "runner selected",
                   {{"runner", selected->Name()}, {"mode", config::ToString(config.mode)}});
        return selected;
    }();
    return *runner;
}

Result RunCmd(const Context& ctx,
              const std::string& repo_dir,
              const std::string& executable,
              const std::vector<std::string>& args,
              std::chrono::milliseconds timeout) {
    return DefaultRunner().RunCmd(ctx, repo_dir, executable, args, timeout);
}

}  // namespace runbox::sandbox
