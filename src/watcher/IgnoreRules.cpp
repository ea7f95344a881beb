#include "watcher/IgnoreRules.hpp"

#include <algorithm>

using namespace wsync::watcher;

IgnoreRules::IgnoreRules(std::vector<std::string> patterns, const bool ignoreHidden)
    : patterns_(std::move(patterns)), ignoreHidden_(ignoreHidden) {
    for (const auto& p : patterns_) {
        if (p.empty()) continue;
        if (p.front() == '*') {
            if (p.size() > 1) suffixes_.push_back(p.substr(1));
            continue;
        }

        auto seg = p;
        while (!seg.empty() && seg.back() == '/') seg.pop_back();
        while (!seg.empty() && seg.front() == '/') seg.erase(seg.begin());
        if (!seg.empty()) segments_.push_back("/" + seg + "/");
    }
}

bool IgnoreRules::isIgnored(const std::string& relPath) const {
    if (relPath.empty() || relPath == ".") return false;

    if (ignoreHidden_) {
        if (relPath.front() == '.') return true;
        if (relPath.find("/.") != std::string::npos) return true;
    }

    if (std::ranges::any_of(suffixes_, [&](const std::string& s) { return relPath.ends_with(s); }))
        return true;

    const auto wrapped = "/" + relPath + "/";
    return std::ranges::any_of(segments_, [&](const std::string& s) {
        return wrapped.find(s) != std::string::npos;
    });
}
