#include "workspace/RemoteLayout.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>

using namespace wsync::workspace;

RemoteLayout::RemoteLayout(std::string userId, std::string conversationId)
    : userId_(std::move(userId)), conversationId_(std::move(conversationId)) {
    validateId(userId_, "user_id");
    validateId(conversationId_, "conversation_id");
    root_ = fmt::format("conversations/{}/{}/workspace", userId_, conversationId_);
}

void RemoteLayout::validateId(const std::string& id, const char* what) {
    if (id.empty()) throw IsolationError(fmt::format("{} must not be empty", what));
    if (id == "." || id == "..")
        throw IsolationError(fmt::format("{} must not be '{}'", what, id));
    if (id.find_first_of("/\\") != std::string::npos)
        throw IsolationError(fmt::format("{} must not contain path separators: '{}'", what, id));
    if (id.find('\0') != std::string::npos)
        throw IsolationError(fmt::format("{} must not contain NUL bytes", what));
}

std::string RemoteLayout::normalizeRelative(const std::string& relPath) {
    if (relPath.empty()) throw IsolationError("Empty workspace path");
    if (relPath.front() == '/' || relPath.front() == '\\')
        throw IsolationError(fmt::format("Absolute path not allowed: '{}'", relPath));

    std::string out;
    size_t start = 0;
    while (start <= relPath.size()) {
        auto end = relPath.find_first_of("/\\", start);
        if (end == std::string::npos) end = relPath.size();
        const auto seg = relPath.substr(start, end - start);

        if (seg == "..") throw IsolationError(fmt::format("Path escapes the workspace: '{}'", relPath));
        if (!seg.empty() && seg != ".") {
            if (!out.empty()) out += '/';
            out += seg;
        }
        start = end + 1;
    }

    if (out.empty()) throw IsolationError(fmt::format("Path names no file: '{}'", relPath));
    return out;
}

std::string RemoteLayout::fileKey(const std::string& relPath) const {
    return filesPrefix() + "/" + normalizeRelative(relPath);
}

std::string RemoteLayout::backupKey(const std::chrono::system_clock::time_point when) const {
    return fmt::format("{}/backup-{}.tar.gz", compressedPrefix(), util::backupTimestamp(when));
}

bool RemoteLayout::owns(const std::string& key) const {
    return key.size() > root_.size() + 1 && key.starts_with(root_) && key[root_.size()] == '/';
}
