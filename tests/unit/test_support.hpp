#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "sandbox/container_backend.hpp"
#include "sandbox/errors.hpp"
#include "utils/logging.hpp"

namespace runbox::testing {

class TempDir {
public:
    TempDir() {
        static std::mt19937_64 rng{std::random_device{}()};
        root_ = std::filesystem::temp_directory_path() /
                ("runbox-test-" + std::to_string(static_cast<unsigned long long>(rng())));
        std::filesystem::create_directories(root_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return root_; }

private:
    std::filesystem::path root_;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content = "") {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

// Collects log messages for the lifetime of the object.
class LogCapture {
public:
    LogCapture() : previous_(utils::GetLogConfig()) {
        utils::SetLogConfig(utils::LogConfig{utils::LogLevel::kDebug});
        utils::SetLogSink([this](const utils::LogMessage& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(message);
        });
    }

    ~LogCapture() {
        utils::SetLogSink({});
        utils::SetLogConfig(previous_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    bool Contains(utils::LogLevel level, const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& message : messages_) {
            if (message.level == level && message.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::size_t Count(utils::LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0;
        for (const auto& message : messages_) {
            if (message.level == level) {
                ++count;
            }
        }
        return count;
    }

private:
    utils::LogConfig previous_;
    mutable std::mutex mutex_;
    std::vector<utils::LogMessage> messages_;
};

inline std::string Frame(std::uint8_t stream, const std::string& payload) {
    std::string frame(8, '\0');
    frame[0] = static_cast<char>(stream);
    const auto size = static_cast<std::uint32_t>(payload.size());
    frame[4] = static_cast<char>((size >> 24) & 0xFF);
    frame[5] = static_cast<char>((size >> 16) & 0xFF);
    frame[6] = static_cast<char>((size >> 8) & 0xFF);
    frame[7] = static_cast<char>(size & 0xFF);
    return frame + payload;
}

// Serves its bytes a few at a time to exercise short reads.
class ChunkedOutputStream : public sandbox::OutputStream {
public:
    ChunkedOutputStream(std::string data, std::size_t chunk)
        : data_(std::move(data)), chunk_(chunk) {}

    std::size_t ReadSome(char* data, std::size_t size) override {
        if (closed_) {
            return 0;
        }
        const auto n = std::min({size, chunk_, data_.size() - offset_});
        std::copy_n(data_.data() + offset_, n, data);
        offset_ += n;
        return n;
    }

    void Close() override { closed_ = true; }

private:
    std::string data_;
    std::size_t chunk_;
    std::size_t offset_ = 0;
    std::atomic<bool> closed_{false};
};

// In-memory container engine. Containers "exit" as soon as they start unless
// `hang` is set, in which case only a kill ends them.
class FakeBackend : public sandbox::ContainerBackend {
public:
    bool ping_fails = false;
    bool image_present = true;
    bool pull_fails = false;
    bool create_fails = false;
    bool start_fails = false;
    bool remove_fails = false;
    bool hang = false;
    std::optional<std::string> wait_error;
    std::int64_t exit_status = 0;
    std::string output;
    std::chrono::milliseconds start_delay{0};

    void Ping(std::chrono::milliseconds) override {
        Record("ping");
        if (ping_fails) {
            throw sandbox::BackendError("connect to /var/run/docker.sock: No such file or directory");
        }
    }

    bool ImageExists(const std::string& image) override {
        Record("inspect " + image);
        return image_present;
    }

    void PullImage(const std::string& image) override {
        Record("pull " + image);
        if (pull_fails) {
            throw sandbox::BackendError("pull access denied for " + image, 404);
        }
    }

    std::string CreateContainer(const sandbox::ContainerSpec& spec) override {
        Record("create");
        if (create_fails) {
            throw sandbox::BackendError("no space left on device", 500);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        specs_.push_back(spec);
        const auto id = "c" + std::to_string(specs_.size());
        live_.insert(id);
        return id;
    }

    std::unique_ptr<sandbox::OutputStream> AttachOutput(const std::string& id) override {
        Record("attach " + id);
        return std::make_unique<ChunkedOutputStream>(output, 3);
    }

    std::shared_ptr<sandbox::WaitChannel> WaitContainer(const std::string& id,
                                                        std::chrono::milliseconds) override {
        Record("wait " + id);
        std::lock_guard<std::mutex> lock(mutex_);
        channel_ = std::make_shared<sandbox::WaitChannel>();
        return channel_;
    }

    void StartContainer(const std::string& id) override {
        Record("start " + id);
        if (start_fails) {
            throw sandbox::BackendError("OCI runtime create failed", 500);
        }
        if (hang) {
            return;
        }
        auto channel = Channel();
        if (wait_error) {
            channel->SetError(*wait_error);
        } else {
            channel->SetStatus(exit_status);
        }
        if (start_delay.count() > 0) {
            std::this_thread::sleep_for(start_delay);
        }
    }

    void KillContainer(const std::string& id, std::chrono::milliseconds) override {
        Record("kill " + id);
        killed_ = true;
        if (auto channel = Channel()) {
            channel->SetStatus(137);
        }
    }

    void RemoveContainer(const std::string& id, std::chrono::milliseconds) override {
        Record("remove " + id);
        if (remove_fails) {
            throw sandbox::BackendError("removal timed out", 500);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        live_.erase(id);
    }

    std::vector<std::string> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    bool Called(const std::string& prefix) const {
        for (const auto& call : Calls()) {
            if (call.rfind(prefix, 0) == 0) {
                return true;
            }
        }
        return false;
    }

    std::vector<sandbox::ContainerSpec> Specs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return specs_;
    }

    std::size_t LiveContainers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_.size();
    }

    bool Killed() const { return killed_; }

private:
    void Record(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(call);
    }

    std::shared_ptr<sandbox::WaitChannel> Channel() {
        std::lock_guard<std::mutex> lock(mutex_);
        return channel_;
    }

    mutable std::mutex mutex_;
    std::vector<std::string> calls_;
    std::vector<sandbox::ContainerSpec> specs_;
    std::set<std::string> live_;
    std::shared_ptr<sandbox::WaitChannel> channel_;
    std::atomic<bool> killed_{false};
};

}  // namespace runbox::testing
