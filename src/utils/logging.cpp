#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>

namespace runbox::utils {
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

bool ShouldLog(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return static_cast<int>(level) >= static_cast<int>(g_log_config.min_level);
}

void Log(const std::string& tag, const LogMessage& msg) {
    if (!ShouldLog(msg.level)) {
        return;
    }
    // Sorted so that lines for the same event are stable across runs.
    const std::map<std::string, std::string> sorted(msg.fields.begin(), msg.fields.end());
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[" << tag << "] " << ToString(msg.level) << " " << msg.message;
    for (const auto& [key, value] : sorted) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

}  // namespace runbox::utils
