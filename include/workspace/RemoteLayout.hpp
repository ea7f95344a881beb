#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace wsync::workspace {

// A key or identifier that would read or write outside the conversation's own prefix.
class IsolationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Remote key layout for one conversation workspace:
//
//   conversations/{user_id}/{conversation_id}/workspace/files/...
//   conversations/{user_id}/{conversation_id}/workspace/compressed/backup-{YYYYMMDD_HHMMSS}.tar.gz
//   conversations/{user_id}/{conversation_id}/workspace/git/workspace.bundle
//
// Every key handed out lies strictly below root().
class RemoteLayout {
public:
    RemoteLayout(std::string userId, std::string conversationId);

    [[nodiscard]] const std::string& userId() const { return userId_; }
    [[nodiscard]] const std::string& conversationId() const { return conversationId_; }

    [[nodiscard]] const std::string& root() const { return root_; }
    [[nodiscard]] std::string filesPrefix() const { return root_ + "/files"; }
    [[nodiscard]] std::string compressedPrefix() const { return root_ + "/compressed"; }
    [[nodiscard]] std::string gitPrefix() const { return root_ + "/git"; }

    // Throws IsolationError for absolute paths or paths escaping through "..".
    [[nodiscard]] std::string fileKey(const std::string& relPath) const;

    [[nodiscard]] std::string backupKey(std::chrono::system_clock::time_point when = std::chrono::system_clock::now()) const;

    [[nodiscard]] std::string gitBundleKey() const { return gitPrefix() + "/workspace.bundle"; }

    [[nodiscard]] bool owns(const std::string& key) const;

    // "a/./b//c.txt" -> "a/b/c.txt"; throws IsolationError on empty, absolute or escaping paths.
    static std::string normalizeRelative(const std::string& relPath);

    static void validateId(const std::string& id, const char* what);

private:
    std::string userId_;
    std::string conversationId_;
    std::string root_;
};

}
