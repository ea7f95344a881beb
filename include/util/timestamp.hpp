#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace wsync::util {

inline std::string timestampToString(const std::time_t ts) {
    std::ostringstream oss;
    std::tm tm{};
    gmtime_r(&ts, &tm);
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

// SigV4 x-amz-date, e.g. 20240101T120000Z
inline std::string getCurrentTimestamp() {
    const std::time_t now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now_c, &tm);
    char buffer[17];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm);
    return {buffer};
}

// Backup archive suffix, e.g. 20240101_120000
inline std::string backupTimestamp(const std::chrono::system_clock::time_point tp = std::chrono::system_clock::now()) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[16];
    strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &tm);
    return {buffer};
}

} // namespace wsync::util
