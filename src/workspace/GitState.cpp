#include "workspace/GitState.hpp"
#include "util/process.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <sstream>

using namespace wsync::workspace;
using namespace wsync::logging;
namespace fs = std::filesystem;

namespace {

std::vector<BundleRef>::const_iterator findRef(const std::vector<BundleRef>& heads, const std::string& ref) {
    return std::ranges::find_if(heads, [&](const BundleRef& r) { return r.ref == ref; });
}

}

GitState::GitState(fs::path workspace, std::string gitExecutable)
    : workspace_(std::move(workspace)), git_(std::move(gitExecutable)) {}

bool GitState::hasRepository() const {
    std::error_code ec;
    return fs::exists(workspace_ / ".git", ec);
}

std::string GitState::git(const std::vector<std::string>& args) const {
    std::vector<std::string> argv{git_};
    argv.insert(argv.end(), args.begin(), args.end());
    return util::runProcessChecked(argv, workspace_).output;
}

void GitState::createBundle(const fs::path& bundlePath) const {
    if (!hasRepository())
        throw std::runtime_error("No git repository in " + workspace_.string());

    LogRegistry::git()->debug("[GitState] Creating bundle {} from {}", bundlePath.string(), workspace_.string());
    git({"bundle", "create", bundlePath.string(), "--all"});
    LogRegistry::git()->info("[GitState] Bundle created ({} bytes)", fs::file_size(bundlePath));
}

std::vector<BundleRef> GitState::listHeads(const fs::path& bundlePath) const {
    return parseBundleHeads(git({"bundle", "list-heads", bundlePath.string()}));
}

void GitState::restoreFromBundle(const fs::path& bundlePath) const {
    if (hasRepository())
        throw std::runtime_error("Refusing to restore over existing repository in " + workspace_.string());

    fs::create_directories(workspace_);
    git({"init", "--quiet"});

    const auto heads = listHeads(bundlePath);
    if (heads.empty()) {
        LogRegistry::git()->warn("[GitState] Bundle {} lists no refs, leaving empty repository", bundlePath.string());
        return;
    }

    // --update-head-ok: the unborn branch HEAD points at may be among the fetched refs
    git({"fetch", "--quiet", "--update-head-ok", bundlePath.string(),
         "+refs/heads/*:refs/heads/*", "+refs/tags/*:refs/tags/*"});

    if (const auto branch = resolveHeadBranch(heads)) {
        git({"symbolic-ref", "HEAD", *branch});
        LogRegistry::git()->debug("[GitState] HEAD -> {}", *branch);
    } else {
        const auto head = findRef(heads, "HEAD");
        if (head == heads.end()) {
            LogRegistry::git()->warn("[GitState] Bundle has no branch or HEAD to check out");
            return;
        }
        git({"update-ref", "--no-deref", "HEAD", head->sha});
        LogRegistry::git()->debug("[GitState] Detached HEAD at {}", head->sha);
    }

    git({"reset", "--quiet", "--mixed"});
    LogRegistry::git()->info("[GitState] Restored {} refs into {}", heads.size(), workspace_.string());
}

std::vector<BundleRef> GitState::parseBundleHeads(const std::string& output) {
    std::vector<BundleRef> out;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const auto sp = line.find(' ');
        if (sp == std::string::npos || sp == 0 || sp + 1 >= line.size()) continue;
        out.push_back({line.substr(0, sp), line.substr(sp + 1)});
    }
    return out;
}

std::optional<std::string> GitState::resolveHeadBranch(const std::vector<BundleRef>& heads) {
    const auto isBranch = [](const BundleRef& r) { return r.ref.starts_with("refs/heads/"); };

    const auto head = findRef(heads, "HEAD");
    if (head != heads.end()) {
        // Prefer main/master when several branches share HEAD's commit
        for (const auto* preferred : {"refs/heads/main", "refs/heads/master"}) {
            const auto it = findRef(heads, preferred);
            if (it != heads.end() && it->sha == head->sha) return it->ref;
        }
        const auto match = std::ranges::find_if(heads, [&](const BundleRef& r) {
            return isBranch(r) && r.sha == head->sha;
        });
        if (match != heads.end()) return match->ref;
        return std::nullopt;
    }

    for (const auto* preferred : {"refs/heads/main", "refs/heads/master"})
        if (findRef(heads, preferred) != heads.end()) return std::string(preferred);

    const auto first = std::ranges::find_if(heads, isBranch);
    if (first != heads.end()) return first->ref;
    return std::nullopt;
}
