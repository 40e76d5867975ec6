#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/log_demux.hpp"

namespace runbox::sandbox {

struct BindMount {
    std::string source;
    std::string target;
    bool read_only = false;
};

struct Ulimit {
    std::string name;
    std::int64_t soft = 0;
    std::int64_t hard = 0;
};

// Everything needed to create one locked-down execution unit.
struct ContainerSpec {
    std::string image;
    std::vector<std::string> cmd;
    std::string working_dir;
    std::string user;
    std::vector<std::string> env;
    bool network_disabled = true;
    std::vector<BindMount> mounts;
    std::int64_t memory_bytes = 0;
    std::int64_t nano_cpus = 0;
    std::vector<Ulimit> ulimits;
    std::vector<std::string> cap_drop;
    std::vector<std::string> security_opt;
    bool read_only_rootfs = true;
    std::map<std::string, std::string> tmpfs;
    bool auto_remove = true;
};

// Outcome slot for one container wait, filled by whichever thread talks to the backend.
class WaitChannel {
public:
    using Clock = std::chrono::steady_clock;

    void SetStatus(std::int64_t status) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (status_ || error_) {
                return;
            }
            status_ = status;
        }
        cv_.notify_all();
    }

    void SetError(std::string error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (status_ || error_) {
                return;
            }
            error_ = std::move(error);
        }
        cv_.notify_all();
    }

    // Waits until a status or error is set, or `until` passes. Returns true if set.
    bool WaitUntil(Clock::time_point until) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, until, [this] { return status_.has_value() || error_.has_value(); });
    }

    std::optional<std::int64_t> Status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return status_;
    }

    std::optional<std::string> Error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<std::int64_t> status_;
    std::optional<std::string> error_;
};

// Combined stdout/stderr stream of a unit, in the backend's multiplexed framing.
class OutputStream : public ByteSource {
public:
    // Unblocks a pending ReadSome from another thread; later reads return 0.
    virtual void Close() = 0;
};

// Client for a container engine. Every call is bounded and throws BackendError.
class ContainerBackend {
public:
    virtual ~ContainerBackend() = default;

    virtual void Ping(std::chrono::milliseconds timeout) = 0;
    virtual bool ImageExists(const std::string& image) = 0;
    virtual void PullImage(const std::string& image) = 0;
    virtual std::string CreateContainer(const ContainerSpec& spec) = 0;
    // Must be called before StartContainer so that no output is missed.
    virtual std::unique_ptr<OutputStream> AttachOutput(const std::string& id) = 0;
    // Registers the exit wait and returns once the backend accepted it. The channel is
    // filled asynchronously; `timeout` bounds how long the wait may stay open.
    virtual std::shared_ptr<WaitChannel> WaitContainer(const std::string& id,
                                                       std::chrono::milliseconds timeout) = 0;
    virtual void StartContainer(const std::string& id) = 0;
    virtual void KillContainer(const std::string& id, std::chrono::milliseconds timeout) = 0;
    // Removing a unit that no longer exists is not an error.
    virtual void RemoveContainer(const std::string& id, std::chrono::milliseconds timeout) = 0;
};

}  // namespace runbox::sandbox
