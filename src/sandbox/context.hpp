#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace runbox::sandbox {

enum class ContextError {
    kNone,
    kCanceled,
    kDeadlineExceeded
};

const char* ToString(ContextError error);

// Cancellation scope for one command. Copies share state; children derived with
// WithCancel/WithTimeout end when their parent ends.
class Context {
public:
    using Clock = std::chrono::steady_clock;

    static Context Background();
    static Context WithCancel(const Context& parent);
    static Context WithTimeout(const Context& parent, Clock::duration timeout);

    void Cancel() const;
    bool Done() const;
    ContextError Err() const;
    std::optional<Clock::time_point> Deadline() const;

    // Blocks until the context ends or `timeout` elapses. Returns Done().
    bool WaitFor(Clock::duration timeout) const;

private:
    struct State {
        std::shared_ptr<State> parent;
        std::optional<Clock::time_point> deadline;
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool canceled = false;
    };

    explicit Context(std::shared_ptr<State> state);

    static ContextError StateErr(const State& state);

    std::shared_ptr<State> state_;
};

}  // namespace runbox::sandbox
