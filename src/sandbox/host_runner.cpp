#include "sandbox/host_runner.hpp"

#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace bp = boost::process::v1;
namespace {

constexpr const char* kLogTag = "host";

std::filesystem::path MakeCapturePath(const char* stream) {
    static std::atomic<unsigned long long> counter{0};
    const auto stamp = std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    return std::filesystem::temp_directory_path() /
           ("runbox_" + std::to_string(::getpid()) + "_" + stamp + "_" +
            std::to_string(counter.fetch_add(1)) + "_" + stream + ".log");
}

std::string ReadCapture(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

// Removes the capture files on every exit path.
struct CaptureFiles {
    std::filesystem::path stdout_path = MakeCapturePath("stdout");
    std::filesystem::path stderr_path = MakeCapturePath("stderr");

    ~CaptureFiles() {
        std::error_code ec;
        std::filesystem::remove(stdout_path, ec);
        std::filesystem::remove(stderr_path, ec);
    }
};

// Observes the leader's exit without reaping it, so its process group id cannot be
// reused while the watcher may still signal the group.
void WaitForExitNoReap(pid_t pid) {
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) {
            return;
        }
    }
}

std::string ResolveExecutable(const std::string& executable) {
    if (executable.find('/') != std::string::npos) {
        return executable;
    }
    return bp::search_path(executable).string();
}

}  // namespace

HostRunner::HostRunner(config::RunnerConfig config)
    : config_(std::move(config)) {}

Result HostRunner::RunCmd(const Context& ctx,
                          const std::string& repo_dir,
                          const std::string& executable,
                          const std::vector<std::string>& args,
                          std::chrono::milliseconds timeout) {
    const auto effective_timeout = ResolveTimeout(timeout, config_);
    const auto bounded = Context::WithTimeout(ctx, effective_timeout);

    std::error_code dir_ec;
    if (!std::filesystem::is_directory(repo_dir, dir_ec)) {
        throw SandboxError(ErrorKind::kProcessStart, "working directory does not exist: " + repo_dir);
    }
    const auto program = ResolveExecutable(executable);
    if (program.empty()) {
        throw SandboxError(ErrorKind::kProcessStart, "executable not found in PATH: " + executable);
    }

    CaptureFiles capture;
    utils::Log(utils::LogLevel::kDebug, kLogTag, "exec",
               {{"cmd", utils::FormatCommand(executable, args)},
                {"dir", repo_dir},
                {"timeout_ms", std::to_string(effective_timeout.count())}});

    bp::child child;
    try {
        child = bp::child(
            bp::exe = program,
            bp::args = args,
            bp::start_dir = repo_dir,
            bp::std_in < bp::null,
            bp::std_out > capture.stdout_path.string(),
            bp::std_err > capture.stderr_path.string(),
            bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });
    } catch (const bp::process_error& ex) {
        throw SandboxError(ErrorKind::kProcessStart,
                           "failed to start " + executable + ": " + ex.what());
    }
    const pid_t pid = child.id();

    std::mutex mutex;
    std::condition_variable cv;
    bool finished = false;
    // Set only once the watcher actually signals the group.
    bool signaled = false;

    std::thread watcher([&]() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!finished && !bounded.Done()) {
            cv.wait_for(lock, std::chrono::milliseconds(20));
        }
        if (finished) {
            return;
        }
        signaled = true;
        ::kill(-pid, SIGTERM);
        cv.wait_for(lock, config_.kill_grace, [&] { return finished; });
        // Grandchildren may outlive the leader, so the group is always killed hard.
        ::kill(-pid, SIGKILL);
    });

    WaitForExitNoReap(pid);
    {
        std::lock_guard<std::mutex> lock(mutex);
        finished = true;
    }
    cv.notify_all();
    watcher.join();
    const bool timed_out = signaled;

    std::error_code wait_ec;
    child.wait(wait_ec);

    Result result{};
    result.stdout_text = ReadCapture(capture.stdout_path);
    result.stderr_text = ReadCapture(capture.stderr_path);
    result.timed_out = timed_out;

    const int status = child.native_exit_code();
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = 1;
    }
    if (wait_ec && !WIFSIGNALED(status) && !WIFEXITED(status)) {
        utils::LogWarn(kLogTag, "wait failed for pid " + std::to_string(pid) + ": " + wait_ec.message());
    }
    if (result.timed_out) {
        if (result.exit_code == 0) {
            result.exit_code = kTimeoutExitCode;
        }
        utils::Log(utils::LogLevel::kWarn, kLogTag, "command timed out",
                   {{"cmd", utils::FormatCommand(executable, args)},
                    {"reason", ToString(bounded.Err())}});
    }
    return result;
}

}  // namespace runbox::sandbox
