#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace wsync::config {

// Accepts "250ms", "2s", "1.5s", "5m" or a bare number of seconds.
inline std::chrono::milliseconds parseDuration(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Duration string cannot be empty");

    const auto toMs = [&](const std::string& num, const double scale) {
        std::size_t used = 0;
        const double v = std::stod(num, &used);
        if (used != num.size() || v < 0) throw std::invalid_argument("Invalid duration: " + str);
        return std::chrono::milliseconds(static_cast<int64_t>(v * scale));
    };

    if (str.size() > 2 && str.ends_with("ms")) return toMs(str.substr(0, str.size() - 2), 1.0);
    if (str.back() == 's' || str.back() == 'S') return toMs(str.substr(0, str.size() - 1), 1000.0);
    if (str.back() == 'm' || str.back() == 'M') return toMs(str.substr(0, str.size() - 1), 60000.0);

    // Assume seconds if no suffix
    return toMs(str, 1000.0);
}

inline std::string durationToStr(const std::chrono::milliseconds ms) {
    if (ms.count() % 60000 == 0 && ms.count() != 0) return std::to_string(ms.count() / 60000) + "m";
    if (ms.count() % 1000 == 0) return std::to_string(ms.count() / 1000) + "s";
    return std::to_string(ms.count()) + "ms";
}

inline uintmax_t parseMbOrGbToByte(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Size string cannot be empty");

    std::string upper = str;
    std::ranges::transform(upper, upper.begin(), [](unsigned char c) { return std::toupper(c); });

    if (upper.size() > 2 && upper.ends_with("GB")) return std::stoull(str.substr(0, str.size() - 2)) * 1024 * 1024 * 1024;
    if (upper.size() > 1 && upper.back() == 'G') return std::stoull(str.substr(0, str.size() - 1)) * 1024 * 1024 * 1024;
    if (upper.size() > 2 && upper.ends_with("MB")) return std::stoull(str.substr(0, str.size() - 2)) * 1024 * 1024;
    if (upper.size() > 1 && upper.back() == 'M') return std::stoull(str.substr(0, str.size() - 1)) * 1024 * 1024;

    // Assume MB if no suffix
    return std::stoull(str) * 1024 * 1024;
}

inline std::string bytesToMbOrGbStr(const uintmax_t bytes) {
    if (bytes % (1024 * 1024 * 1024) == 0) return std::to_string(bytes / (1024 * 1024 * 1024)) + "GB";
    return std::to_string(bytes / (1024 * 1024)) + "MB";
}

// Environment-style booleans: "true/false", "1/0", "yes/no", "on/off".
inline bool parseBool(const std::string& str, const bool def) {
    std::string lower = str;
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return def;
}

}
