#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/context.hpp"

namespace runbox::sandbox {

// Exit code reported for commands stopped by their timeout.
inline constexpr int kTimeoutExitCode = 124;
inline constexpr const char* kTimeoutMessage = "Command execution timed out";

struct Result {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool timed_out = false;
};

// Executes one command under one isolation policy.
//
// Infrastructure failures throw SandboxError. A command that runs and fails is not
// an error: check Result::exit_code. A command stopped by its timeout (or by the
// caller's context) returns with timed_out set and a non-zero exit code.
class Runner {
public:
    virtual ~Runner() = default;

    // A timeout <= 0 uses the configured default, then two minutes.
    virtual Result RunCmd(const Context& ctx,
                          const std::string& repo_dir,
                          const std::string& executable,
                          const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout) = 0;

    virtual std::string Name() const = 0;
};

inline std::chrono::milliseconds ResolveTimeout(std::chrono::milliseconds requested,
                                                const config::RunnerConfig& config) {
    if (requested.count() > 0) {
        return requested;
    }
    if (config.default_timeout.count() > 0) {
        return config.default_timeout;
    }
    return config::kDefaultCmdTimeout;
}

}  // namespace runbox::sandbox
