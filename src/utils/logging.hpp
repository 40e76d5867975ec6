#pragma once

#include <functional>
#include <string>
#include <unordered_map>

namespace runbox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

using LogSink = std::function<void(const LogMessage&)>;

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

// Replaces the stderr writer. An empty sink restores it.
void SetLogSink(LogSink sink);

std::string FormatLogMessage(const LogMessage& message);

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields = {});

inline void LogWarn(const std::string& tag, const std::string& message) {
    Log(LogLevel::kWarn, tag, message);
}

}  // namespace runbox::utils
