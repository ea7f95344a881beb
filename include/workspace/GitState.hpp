#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wsync::workspace {

struct BundleRef {
    std::string sha;
    std::string ref;    // "HEAD", "refs/heads/main", ...
};

// Snapshots a workspace's git repository into a single bundle file and rebuilds it from one.
// Runs the git executable as a child process; failures surface as util::ProcessError.
class GitState {
public:
    explicit GitState(std::filesystem::path workspace, std::string gitExecutable = "git");

    [[nodiscard]] bool hasRepository() const;

    // git bundle create <bundle> --all
    void createBundle(const std::filesystem::path& bundlePath) const;

    // Initializes a repository in the workspace, fetches every branch and tag from the bundle,
    // points HEAD where the bundle's HEAD pointed and resets the index to it. Files already in
    // the working tree are left as they are.
    void restoreFromBundle(const std::filesystem::path& bundlePath) const;

    [[nodiscard]] std::vector<BundleRef> listHeads(const std::filesystem::path& bundlePath) const;

    // Parses `git bundle list-heads` output ("<sha> <ref>" per line).
    static std::vector<BundleRef> parseBundleHeads(const std::string& output);

    // Branch HEAD should be attached to, or nullopt for a detached HEAD.
    static std::optional<std::string> resolveHeadBranch(const std::vector<BundleRef>& heads);

    [[nodiscard]] const std::filesystem::path& workspace() const { return workspace_; }

private:
    std::filesystem::path workspace_;
    std::string git_;

    std::string git(const std::vector<std::string>& args) const;
};

}
