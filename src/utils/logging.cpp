#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace runbox::utils {
namespace {

std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

LogConfig& ActiveConfig() {
    static LogConfig config = [] {
        LogConfig initial{};
        if (const char* level = std::getenv("RUNBOX_LOG_LEVEL")) {
            initial.min_level = ParseLogLevel(level, initial.min_level);
        }
        return initial;
    }();
    return config;
}

LogSink& ActiveSink() {
    static LogSink sink;
    return sink;
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void SetLogConfig(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(LogMutex());
    ActiveConfig() = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(LogMutex());
    return ActiveConfig();
}

void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(LogMutex());
    ActiveSink() = std::move(sink);
}

std::string FormatLogMessage(const LogMessage& message) {
    std::ostringstream line;
    line << "[" << message.tag << "] ";
    if (message.level == LogLevel::kWarn) {
        line << "WARNING: ";
    } else if (message.level == LogLevel::kError) {
        line << "ERROR: ";
    }
    line << message.message;
    // Sorted so the same fields always print in the same order.
    const std::map<std::string, std::string> sorted(message.fields.begin(), message.fields.end());
    for (const auto& [key, value] : sorted) {
        line << " " << key << "=" << value;
    }
    return line.str();
}

void Log(LogLevel level,
         const std::string& tag,
         const std::string& message,
         const std::unordered_map<std::string, std::string>& fields) {
    std::lock_guard<std::mutex> lock(LogMutex());
    if (level < ActiveConfig().min_level) {
        return;
    }
    LogMessage entry{level, tag, message, fields};
    if (ActiveSink()) {
        ActiveSink()(entry);
        return;
    }
    std::cerr << FormatLogMessage(entry) << std::endl;
}

}  // namespace runbox::utils
