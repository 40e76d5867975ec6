#pragma once

#include <stdexcept>
#include <string>

namespace runbox::sandbox {

enum class ErrorKind {
    kInvalidArgument,
    kBackendUnavailable,
    kBackend,
    kImage,
    kCreate,
    kStart,
    kWait,
    kProcessStart
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kInvalidArgument: return "invalid_argument";
        case ErrorKind::kBackendUnavailable: return "backend_unavailable";
        case ErrorKind::kBackend: return "backend";
        case ErrorKind::kImage: return "image";
        case ErrorKind::kCreate: return "create";
        case ErrorKind::kStart: return "start";
        case ErrorKind::kWait: return "wait";
        case ErrorKind::kProcessStart: return "process_start";
    }
    return "unknown";
}

// Infrastructure failure. Command failures are reported through Result instead.
class SandboxError : public std::runtime_error {
public:
    SandboxError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Raised by container backends. Status is the HTTP status when one was received.
class BackendError : public SandboxError {
public:
    BackendError(const std::string& message, int status = 0)
        : SandboxError(ErrorKind::kBackend, message), status_(status) {}

    int Status() const { return status_; }

private:
    int status_;
};

}  // namespace runbox::sandbox
