#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace shellpilot::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline bool IsUtf8Continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Keeps at most the last max_bytes bytes, starting on a UTF-8 lead byte.
inline std::string Tail(const std::string& value, std::size_t max_bytes) {
    if (value.size() <= max_bytes) {
        return value;
    }
    auto start = value.size() - max_bytes;
    while (start < value.size() && IsUtf8Continuation(value[start])) {
        ++start;
    }
    return value.substr(start);
}

// Keeps at most the first max_bytes bytes without splitting a UTF-8 sequence.
inline std::string Head(const std::string& value, std::size_t max_bytes) {
    if (value.size() <= max_bytes) {
        return value;
    }
    auto end = max_bytes;
    while (end > 0 && IsUtf8Continuation(value[end])) {
        --end;
    }
    return value.substr(0, end);
}

inline std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

inline std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

inline std::filesystem::path GetDataDir() {
    return GetHomePath() / ".shellpilot";
}

}  // namespace shellpilot::utils
