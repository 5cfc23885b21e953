#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>

namespace codeteam::utils {
namespace {

std::mutex g_log_mutex;
LogConfig g_log_config{};

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
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_config = config;
}

LogConfig GetLogConfig() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_log_config;
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (static_cast<int>(level) < static_cast<int>(g_log_config.min_level)) {
        return;
    }
    std::cerr << "[" << tag << "] ";
    if (level != LogLevel::kInfo) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

}  // namespace codeteam::utils
