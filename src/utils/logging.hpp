#pragma once

#include <atomic>
#include <iostream>
#include <string>

namespace shellpilot::utils {

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

struct LogConfig {
    LogLevel min_level = LogLevel::kWarn;
};

inline std::atomic<LogLevel>& MinLogLevel() {
    static std::atomic<LogLevel> level{LogConfig{}.min_level};
    return level;
}

inline void SetLogConfig(const LogConfig& config) {
    MinLogLevel().store(config.min_level);
}

inline bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(MinLogLevel().load());
}

// Writes "[tag] message" to stderr when level passes the configured minimum.
inline void Log(LogLevel level, const char* tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::cerr << "[" << tag << "] ";
    if (level >= LogLevel::kWarn) {
        std::cerr << ToString(level) << " ";
    }
    std::cerr << message << std::endl;
}

}  // namespace shellpilot::utils
