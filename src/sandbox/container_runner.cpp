#include "sandbox/container_runner.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <future>
#include <thread>

#include "sandbox/errors.hpp"
#include "sandbox/images.hpp"
#include "sandbox/resources.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "workspace/project_detector.hpp"

namespace runbox::sandbox {
namespace {

constexpr const char* kLogTag = "docker";
constexpr auto kWaitSlice = std::chrono::milliseconds(50);
// Extra time the backend wait may stay open after the command's own deadline.
constexpr auto kWaitGrace = std::chrono::seconds(30);

// Removes the unit on every exit path. Failures are logged, never thrown.
class ContainerGuard {
public:
    ContainerGuard(ContainerBackend& backend, std::string id, std::chrono::milliseconds timeout)
        : backend_(backend), id_(std::move(id)), timeout_(timeout) {}

    ~ContainerGuard() {
        try {
            backend_.RemoveContainer(id_, timeout_);
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, kLogTag, "failed to remove container",
                       {{"id", id_}, {"error", ex.what()}});
        }
    }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    ContainerBackend& backend_;
    std::string id_;
    std::chrono::milliseconds timeout_;
};

// Demultiplexes the attached stream on its own thread so a chatty command never
// blocks on a full pipe.
class OutputCollector {
public:
    explicit OutputCollector(std::unique_ptr<OutputStream> stream)
        : stream_(std::move(stream)) {
        auto task = std::packaged_task<DemuxedOutput()>([this] { return Demultiplex(*stream_); });
        result_ = task.get_future();
        worker_ = std::thread(std::move(task));
    }

    ~OutputCollector() {
        Stop();
    }

    OutputCollector(const OutputCollector&) = delete;
    OutputCollector& operator=(const OutputCollector&) = delete;

    // Waits up to `timeout` for end of stream, then closes it and returns what arrived.
    DemuxedOutput Collect(std::chrono::milliseconds timeout) {
        if (result_.wait_for(timeout) != std::future_status::ready) {
            utils::LogWarn(kLogTag, "output stream did not end in time, output may be truncated");
        }
        Stop();
        return result_.get();
    }

    void Stop() {
        if (worker_.joinable()) {
            stream_->Close();
            worker_.join();
        }
    }

private:
    std::unique_ptr<OutputStream> stream_;
    std::future<DemuxedOutput> result_;
    std::thread worker_;
};

}  // namespace

ContainerRunner::ContainerRunner(config::RunnerConfig config, std::shared_ptr<ContainerBackend> backend)
    : config_(std::move(config)), backend_(std::move(backend)) {
    if (!backend_) {
        throw SandboxError(ErrorKind::kBackendUnavailable, "no container backend");
    }
    try {
        backend_->Ping(config_.probe_timeout);
    } catch (const BackendError& ex) {
        throw SandboxError(ErrorKind::kBackendUnavailable,
                           std::string("Docker daemon not accessible: ") + ex.what());
    }
}

ContainerSpec ContainerRunner::BuildSpec(const std::string& image,
                                         const std::string& abs_repo_dir,
                                         const std::string& executable,
                                         const std::vector<std::string>& args) const {
    ContainerSpec spec{};
    spec.image = image;
    spec.cmd.push_back(executable);
    spec.cmd.insert(spec.cmd.end(), args.begin(), args.end());
    spec.working_dir = kContainerWorkdir;
    spec.user = kContainerUser;
    // HOME must point at the only writable scratch area.
    spec.env = {"HOME=/tmp"};
    spec.network_disabled = true;
    spec.mounts.push_back(BindMount{abs_repo_dir, kContainerWorkdir, false});
    spec.memory_bytes = ParseMemory(config_.memory_limit);
    spec.nano_cpus = CpuNanoQuota(ParseCpu(config_.cpu_limit));
    spec.ulimits.push_back(Ulimit{"nofile", kContainerNofileLimit, kContainerNofileLimit});
    spec.cap_drop = {"ALL"};
    spec.security_opt = {"no-new-privileges"};
    spec.read_only_rootfs = true;
    spec.tmpfs["/tmp"] = "rw,noexec,nosuid,size=100m";
    spec.auto_remove = true;
    return spec;
}

void ContainerRunner::EnsureImage(const std::string& image) {
    try {
        if (backend_->ImageExists(image)) {
            return;
        }
        utils::Log(utils::LogLevel::kInfo, kLogTag, "pulling image", {{"image", image}});
        backend_->PullImage(image);
    } catch (const BackendError& ex) {
        throw SandboxError(ErrorKind::kImage,
                           "failed to ensure image " + image + ": " + ex.what());
    }
}

Result ContainerRunner::RunCmd(const Context& ctx,
                               const std::string& repo_dir,
                               const std::string& executable,
                               const std::vector<std::string>& args,
                               std::chrono::milliseconds timeout) {
    const auto effective_timeout = ResolveTimeout(timeout, config_);

    const auto project_type = workspace::DetectProjectType(repo_dir);
    const auto image = GetImage(project_type, config_);
    EnsureImage(image);

    std::error_code ec;
    const auto abs_repo_dir = std::filesystem::absolute(repo_dir, ec);
    if (ec || !std::filesystem::is_directory(abs_repo_dir, ec)) {
        throw SandboxError(ErrorKind::kInvalidArgument,
                           "failed to resolve repository directory: " + repo_dir);
    }

    const auto spec = BuildSpec(image, abs_repo_dir.string(), executable, args);
    std::string id;
    try {
        id = backend_->CreateContainer(spec);
    } catch (const BackendError& ex) {
        throw SandboxError(ErrorKind::kCreate, std::string("failed to create container: ") + ex.what());
    }
    ContainerGuard guard(*backend_, id, config_.cleanup_timeout);

    utils::Log(utils::LogLevel::kDebug, kLogTag, "container created",
               {{"id", id},
                {"image", image},
                {"project", workspace::ToString(project_type)},
                {"cmd", utils::FormatCommand(executable, args)}});

    const auto exec_ctx = Context::WithTimeout(ctx, effective_timeout);

    std::unique_ptr<OutputCollector> output;
    std::shared_ptr<WaitChannel> wait;
    try {
        output = std::make_unique<OutputCollector>(backend_->AttachOutput(id));
        wait = backend_->WaitContainer(id, effective_timeout + kWaitGrace);
        backend_->StartContainer(id);
    } catch (const BackendError& ex) {
        throw SandboxError(ErrorKind::kStart, std::string("failed to start container: ") + ex.what());
    }

    std::int64_t exit_code = 0;
    while (true) {
        // A status that already arrived wins over a deadline that passed meanwhile.
        if (const auto status = wait->Status()) {
            exit_code = *status;
            break;
        }
        if (const auto error = wait->Error()) {
            throw SandboxError(ErrorKind::kWait, "container wait error: " + *error);
        }
        if (exec_ctx.Done()) {
            try {
                backend_->KillContainer(id, config_.cleanup_timeout);
            } catch (const std::exception& ex) {
                utils::Log(utils::LogLevel::kWarn, kLogTag, "failed to kill container",
                           {{"id", id}, {"error", ex.what()}});
            }
            output->Stop();
            utils::Log(utils::LogLevel::kWarn, kLogTag, "command timed out",
                       {{"id", id},
                        {"cmd", utils::FormatCommand(executable, args)},
                        {"reason", ToString(exec_ctx.Err())}});
            Result timed_out{};
            timed_out.exit_code = kTimeoutExitCode;
            timed_out.timed_out = true;
            timed_out.stderr_text = kTimeoutMessage;
            return timed_out;
        }
        auto wake = WaitChannel::Clock::now() + kWaitSlice;
        if (const auto deadline = exec_ctx.Deadline()) {
            wake = std::min(wake, *deadline);
        }
        wait->WaitUntil(wake);
    }

    const auto demuxed = output->Collect(config_.cleanup_timeout);
    Result result{};
    result.stdout_text = demuxed.stdout_text;
    result.stderr_text = demuxed.stderr_text;
    result.exit_code = static_cast<int>(exit_code);
    result.timed_out = false;
    return result;
}

}  // namespace runbox::sandbox
