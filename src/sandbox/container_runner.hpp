#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/container_backend.hpp"
#include "sandbox/runner.hpp"

namespace runbox::sandbox {

inline constexpr const char* kContainerWorkdir = "/workspace";
inline constexpr const char* kContainerUser = "1000:1000";
inline constexpr std::int64_t kContainerNofileLimit = 1024;

// Runs every command in a fresh container: no network, no capabilities, read-only
// root, the repository mounted at /workspace. The container is removed before
// RunCmd returns.
class ContainerRunner : public Runner {
public:
    // Pings the backend and throws SandboxError(kBackendUnavailable) if it is down.
    ContainerRunner(config::RunnerConfig config, std::shared_ptr<ContainerBackend> backend);

    Result RunCmd(const Context& ctx,
                  const std::string& repo_dir,
                  const std::string& executable,
                  const std::vector<std::string>& args,
                  std::chrono::milliseconds timeout) override;

    std::string Name() const override { return "docker"; }

    ContainerSpec BuildSpec(const std::string& image,
                            const std::string& abs_repo_dir,
                            const std::string& executable,
                            const std::vector<std::string>& args) const;

private:
    void EnsureImage(const std::string& image);

    config::RunnerConfig config_;
    std::shared_ptr<ContainerBackend> backend_;
};

}  // namespace runbox::sandbox
