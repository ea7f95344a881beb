#pragma once

#include <string>
#include <vector>

namespace wsync::watcher {

// Decides which workspace-relative paths the watcher and full syncs skip.
//
// A pattern starting with '*' matches as a suffix ("*.pyc", "*~"). Any other
// pattern matches whole path components anywhere in the path: "node_modules"
// hits "a/node_modules/b.js" but not "my_node_modules.txt", and ".git/refs/heads/"
// hits everything below that directory. With hidden-path ignoring enabled, a
// path with any component starting with '.' is skipped as well.
class IgnoreRules {
public:
    explicit IgnoreRules(std::vector<std::string> patterns, bool ignoreHidden = true);

    [[nodiscard]] bool isIgnored(const std::string& relPath) const;

    [[nodiscard]] const std::vector<std::string>& patterns() const { return patterns_; }
    [[nodiscard]] bool ignoresHidden() const { return ignoreHidden_; }

private:
    std::vector<std::string> patterns_;
    std::vector<std::string> suffixes_;
    std::vector<std::string> segments_;   // stored as "/pattern/"
    bool ignoreHidden_;
};

}
