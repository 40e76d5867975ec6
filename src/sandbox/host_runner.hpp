#pragma once

#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/runner.hpp"

namespace runbox::sandbox {

// Runs commands directly on the host with no isolation. Each command gets its own
// process group so a timeout reclaims everything it forked.
class HostRunner : public Runner {
public:
    explicit HostRunner(config::RunnerConfig config);

    Result RunCmd(const Context& ctx,
                  const std::string& repo_dir,
                  const std::string& executable,
                  const std::vector<std::string>& args,
                  std::chrono::milliseconds timeout) override;

    std::string Name() const override { return "host"; }

private:
    config::RunnerConfig config_;
};

}  // namespace runbox::sandbox
