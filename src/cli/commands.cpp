#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>

#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/images.hpp"
#include "sandbox/runner_factory.hpp"
#include "workspace/project_detector.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

// Reported when runbox itself fails rather than the command.
constexpr int kInfrastructureExitCode = 125;

constexpr const char* kUsage =
    "Usage:\n"
    "  runbox run [--mode docker|host|auto] [--timeout 2m] [--dir PATH] [--json] -- EXE [ARGS...]\n"
    "  runbox test|build|lint [--mode M] [--timeout D] [--json] [DIR]\n"
    "  runbox detect [DIR]\n"
    "  runbox image [DIR]\n"
    "  runbox probe\n";

struct RunOptions {
    std::optional<runbox::config::Mode> mode;
    std::chrono::milliseconds timeout{0};
    std::string dir = ".";
    bool json = false;
    std::vector<std::string> command;
};

void HandleSignal(int signal) {
    g_signal = signal;
}

// Parses flags up to "--" (or the first positional argument). Returns nullopt and
// prints the problem on malformed input.
std::optional<RunOptions> ParseRunOptions(int argc, char** argv, int start, bool dir_positional) {
    RunOptions options{};
    int i = start;
    for (; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg == "--json") {
            options.json = true;
            continue;
        }
        if (arg == "--mode" || arg == "--timeout" || arg == "--dir") {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << std::endl;
                return std::nullopt;
            }
            const std::string value = argv[++i];
            if (arg == "--mode") {
                options.mode = runbox::config::ParseMode(value);
            } else if (arg == "--timeout") {
                const auto parsed = runbox::config::ParseDuration(value);
                if (!parsed) {
                    std::cerr << "invalid --timeout value: " << value << std::endl;
                    return std::nullopt;
                }
                options.timeout = *parsed;
            } else {
                options.dir = value;
            }
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            std::cerr << "unknown flag: " << arg << std::endl;
            return std::nullopt;
        }
        break;
    }
    for (; i < argc; ++i) {
        options.command.emplace_back(argv[i]);
    }
    if (dir_positional && !options.command.empty()) {
        options.dir = options.command.front();
        options.command.clear();
    }
    return options;
}

void PrintResult(const runbox::sandbox::Result& result, const std::string& runner, bool json) {
    if (json) {
        nlohmann::json out = {
            {"runner", runner},
            {"stdout", result.stdout_text},
            {"stderr", result.stderr_text},
            {"exitCode", result.exit_code},
            {"timedOut", result.timed_out}
        };
        std::cout << out.dump(2) << std::endl;
        return;
    }
    if (!result.stdout_text.empty()) {
        std::cout << result.stdout_text;
        if (result.stdout_text.back() != '\n') {
            std::cout << std::endl;
        }
    }
    if (!result.stderr_text.empty()) {
        std::cerr << result.stderr_text;
        if (result.stderr_text.back() != '\n') {
            std::cerr << std::endl;
        }
    }
    if (result.timed_out) {
        std::cerr << "[runbox] command timed out" << std::endl;
    }
}

// Ends the signal watcher on every path out of Execute.
struct SignalWatchStop {
    std::atomic<bool>& finished;
    std::thread& watcher;

    ~SignalWatchStop() {
        finished.store(true);
        watcher.join();
    }
};

int Execute(const RunOptions& options) {
    if (options.command.empty()) {
        std::cerr << kUsage;
        return 2;
    }
    auto config = runbox::config::LoadRunnerConfig();
    if (options.mode) {
        config.mode = *options.mode;
    }

    const auto runner = runbox::sandbox::NewRunner(config);
    const auto ctx = runbox::sandbox::Context::WithCancel(runbox::sandbox::Context::Background());

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> finished{false};
    std::thread signal_watch([&ctx, &finished]() {
        while (!finished.load()) {
            if (g_signal != 0) {
                ctx.Cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    SignalWatchStop stop{finished, signal_watch};

    const std::vector<std::string> args(options.command.begin() + 1, options.command.end());
    const auto result = runner->RunCmd(ctx, options.dir, options.command.front(), args, options.timeout);
    PrintResult(result, runner->Name(), options.json);
    return result.exit_code;
}

int RunProjectCommand(const std::string& kind, RunOptions options) {
    const auto type = runbox::workspace::DetectProjectType(options.dir);
    std::optional<runbox::workspace::ProjectCommand> command;
    if (kind == "test") {
        command = runbox::workspace::GetTestCommand(type);
    } else if (kind == "build") {
        command = runbox::workspace::GetBuildCommand(type);
    } else {
        command = runbox::workspace::GetLintCommand(type);
    }
    if (!command) {
        std::cerr << "no " << kind << " command for project type "
                  << runbox::workspace::ToString(type) << std::endl;
        return 2;
    }
    options.command.clear();
    options.command.push_back(command->executable);
    options.command.insert(options.command.end(), command->args.begin(), command->args.end());
    return Execute(options);
}

std::string DirArgument(int argc, char** argv) {
    return argc >= 3 ? std::string(argv[2]) : std::string(".");
}

int Dispatch(int argc, char** argv) {
    if (argc < 2) {
        std::cout << kUsage;
        return 2;
    }
    const std::string command = argv[1];

    if (command == "run") {
        const auto options = ParseRunOptions(argc, argv, 2, false);
        return options ? Execute(*options) : 2;
    }

    if (command == "test" || command == "build" || command == "lint") {
        const auto options = ParseRunOptions(argc, argv, 2, true);
        return options ? RunProjectCommand(command, *options) : 2;
    }

    if (command == "detect") {
        const auto type = runbox::workspace::DetectProjectType(DirArgument(argc, argv));
        std::cout << runbox::workspace::ToString(type) << std::endl;
        return 0;
    }

    if (command == "image") {
        const auto config = runbox::config::LoadRunnerConfig();
        const auto type = runbox::workspace::DetectProjectType(DirArgument(argc, argv));
        std::cout << runbox::sandbox::GetImage(type, config) << std::endl;
        return 0;
    }

    if (command == "probe") {
        const auto config = runbox::config::LoadRunnerConfig();
        const bool available = runbox::sandbox::IsContainerBackendAvailable(config);
        std::cout << "mode=" << runbox::config::ToString(config.mode)
                  << " docker_host=" << config.docker_host
                  << " available=" << (available ? "true" : "false") << std::endl;
        return available ? 0 : 1;
    }

    std::cout << kUsage;
    return 2;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return Dispatch(argc, argv);
    } catch (const runbox::sandbox::SandboxError& ex) {
        std::cerr << "[runbox] " << runbox::sandbox::ToString(ex.Kind()) << " error: " << ex.what() << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[runbox] error: " << ex.what() << std::endl;
    }
    return kInfrastructureExitCode;
}
