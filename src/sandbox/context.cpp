#include "sandbox/context.hpp"

#include <algorithm>

namespace runbox::sandbox {
namespace {

// Parent cancellation is observed by polling, so waits never sleep longer than this.
constexpr auto kParentPollInterval = std::chrono::milliseconds(20);

}  // namespace

const char* ToString(ContextError error) {
    switch (error) {
        case ContextError::kNone: return "none";
        case ContextError::kCanceled: return "context canceled";
        case ContextError::kDeadlineExceeded: return "context deadline exceeded";
    }
    return "unknown";
}

Context::Context(std::shared_ptr<State> state)
    : state_(std::move(state)) {}

Context Context::Background() {
    return Context(std::make_shared<State>());
}

Context Context::WithCancel(const Context& parent) {
    auto state = std::make_shared<State>();
    state->parent = parent.state_;
    state->deadline = parent.Deadline();
    return Context(std::move(state));
}

Context Context::WithTimeout(const Context& parent, Clock::duration timeout) {
    auto state = std::make_shared<State>();
    state->parent = parent.state_;
    auto deadline = Clock::now() + timeout;
    if (const auto inherited = parent.Deadline(); inherited && *inherited < deadline) {
        deadline = *inherited;
    }
    state->deadline = deadline;
    return Context(std::move(state));
}

void Context::Cancel() const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->canceled = true;
    }
    state_->cv.notify_all();
}

ContextError Context::StateErr(const State& state) {
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.canceled) {
            return ContextError::kCanceled;
        }
    }
    if (state.parent) {
        const auto parent_err = StateErr(*state.parent);
        if (parent_err != ContextError::kNone) {
            return parent_err;
        }
    }
    if (state.deadline && Clock::now() >= *state.deadline) {
        return ContextError::kDeadlineExceeded;
    }
    return ContextError::kNone;
}

bool Context::Done() const {
    return Err() != ContextError::kNone;
}

ContextError Context::Err() const {
    return StateErr(*state_);
}

std::optional<Context::Clock::time_point> Context::Deadline() const {
    return state_->deadline;
}

bool Context::WaitFor(Clock::duration timeout) const {
    const auto until = Clock::now() + timeout;
    while (!Done()) {
        const auto now = Clock::now();
        if (now >= until) {
            return false;
        }
        auto wake = std::min(until, now + kParentPollInterval);
        if (state_->deadline) {
            wake = std::min(wake, *state_->deadline);
        }
        std::unique_lock<std::mutex> lock(state_->mutex);
        state_->cv.wait_until(lock, wake, [this] { return state_->canceled; });
    }
    return true;
}

}  // namespace runbox::sandbox
