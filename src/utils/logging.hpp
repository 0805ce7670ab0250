#pragma once

#include <string>
#include <unordered_map>

namespace runbox::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback);

struct LogMessage {
    LogLevel level;
    std::string message;
    std::unordered_map<std::string, std::string> fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void SetLogConfig(const LogConfig& config);
LogConfig GetLogConfig();

bool ShouldLog(LogLevel level);

// Writes "[tag] LEVEL message key=value ..." to stderr.
void Log(const std::string& tag, const LogMessage& msg);

inline void LogDebug(const std::string& tag,
                     std::string message,
                     std::unordered_map<std::string, std::string> fields = {}) {
    Log(tag, LogMessage{LogLevel::kDebug, std::move(message), std::move(fields)});
}

inline void LogInfo(const std::string& tag,
                    std::string message,
                    std::unordered_map<std::string, std::string> fields = {}) {
    Log(tag, LogMessage{LogLevel::kInfo, std::move(message), std::move(fields)});
}

inline void LogWarn(const std::string& tag,
                    std::string message,
                    std::unordered_map<std::string, std::string> fields = {}) {
    Log(tag, LogMessage{LogLevel::kWarn, std::move(message), std::move(fields)});
}

inline void LogError(const std::string& tag,
                     std::string message,
                     std::unordered_map<std::string, std::string> fields = {}) {
    Log(tag, LogMessage{LogLevel::kError, std::move(message), std::move(fields)});
}

}  // namespace runbox::utils
