#include "workspace/WorkspaceManager.hpp"
#include "workspace/BackupService.hpp"
#include "workspace/GitState.hpp"
#include "watcher/SmartFileWatcher.hpp"
#include "concurrency/ThreadPool.hpp"
#include "concurrency/TransferBatch.hpp"
#include "util/process.hpp"
#include "util/TempFile.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace wsync::workspace;
using namespace wsync::logging;
using namespace wsync::storage;
namespace fs = std::filesystem;

namespace wsync::workspace {

std::string_view to_string(const ManagerState state) {
    switch (state) {
        case ManagerState::UNINITIALIZED: return "uninitialized";
        case ManagerState::INITIALIZING: return "initializing";
        case ManagerState::RUNNING: return "running";
        case ManagerState::SHUTTING_DOWN: return "shutting_down";
        case ManagerState::STOPPED: return "stopped";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const ManagerStatus& s) {
    j = {
        {"conversation_id", s.conversation_id},
        {"user_id", s.user_id},
        {"workspace_path", s.workspace_path},
        {"state", std::string(to_string(s.state))},
        {"is_initialized", s.is_initialized},
        {"shutdown_in_progress", s.shutdown_in_progress},
        {"remote_paths", {
            {"files", s.files_prefix},
            {"compressed", s.compressed_prefix},
            {"git", s.git_bundle_key}
        }}
    };
    if (s.watcher) j["watcher"] = *s.watcher;
    else j["watcher"] = nullptr;
}

}

ManagerOptions ManagerOptions::fromConfig(const config::Config& cfg) {
    ManagerOptions o;
    o.watcher = cfg.watcher;
    o.backup_interval = cfg.workspace.backup_interval;
    o.git_enabled = cfg.workspace.git_enabled;
    o.git_executable = cfg.workspace.git_executable;
    o.tar_executable = cfg.workspace.tar_executable;
    o.backup_excludes = cfg.workspace.backup_excludes;
    o.transfer_concurrency = cfg.storage.max_concurrent_transfers;
    return o;
}

namespace {

std::vector<std::string> fullSyncPatterns(const std::vector<std::string>& excludes) {
    auto patterns = excludes;
    // The repository travels as a bundle, not as loose objects
    if (std::ranges::find(patterns, std::string(".git")) == patterns.end()) patterns.emplace_back(".git");
    return patterns;
}

// What the watcher skips never has its deletions seen, so tar leaves it out as well
std::vector<std::string> archiveExcludes(const ManagerOptions& o) {
    auto patterns = o.backup_excludes;
    for (const auto& p : o.watcher.ignore_patterns)
        if (std::ranges::find(patterns, p) == patterns.end()) patterns.push_back(p);
    return patterns;
}

}

WorkspaceManager::WorkspaceManager(std::shared_ptr<WorkspaceStorage> storage,
                                   std::string conversationId,
                                   std::string userId,
                                   fs::path workspacePath,
                                   ManagerOptions options)
    : storage_(std::move(storage)),
      layout_(std::move(userId), std::move(conversationId)),
      path_(std::move(workspacePath)),
      options_(std::move(options)),
      archiver_(options_.tar_executable, archiveExcludes(options_)),
      fullSyncRules_(fullSyncPatterns(options_.backup_excludes), false),
      watchRules_(options_.watcher.ignore_patterns, options_.watcher.ignore_hidden),
      transferPool_(std::make_unique<concurrency::ThreadPool>(std::max(1u, options_.transfer_concurrency),
                                                              "WorkspaceSyncPool")) {
    if (!storage_) throw std::invalid_argument("WorkspaceManager requires a storage backend");
    if (path_.empty()) throw std::invalid_argument("WorkspaceManager requires a workspace path");
    options_.watcher.validate();

    LogRegistry::wsync()->info("[WorkspaceManager] Created for conversation {} (user {}) at {} -> {}",
                               layout_.conversationId(), layout_.userId(), path_.string(), layout_.root());
}

WorkspaceManager::~WorkspaceManager() {
    if (state() == ManagerState::RUNNING && !shutdownInProgress_)
        LogRegistry::sync()->warn("[WorkspaceManager] Destroyed without a final sync, unsynced changes in {} may be lost",
                                  path_.string());
    stopServices();
    transferPool_->stop();
}

ManagerState WorkspaceManager::state() const {
    std::scoped_lock lock(stateMutex_);
    return state_;
}

void WorkspaceManager::setState(const ManagerState s) {
    std::scoped_lock lock(stateMutex_);
    state_ = s;
}

void WorkspaceManager::initialize() {
    {
        std::scoped_lock lock(stateMutex_);
        if (state_ != ManagerState::UNINITIALIZED) {
            LogRegistry::wsync()->warn("[WorkspaceManager] Already initialized (state: {})", to_string(state_));
            return;
        }
        state_ = ManagerState::INITIALIZING;
    }

    LogRegistry::wsync()->info("[WorkspaceManager] Initializing workspace {} for conversation {}",
                               path_.string(), layout_.conversationId());

    try {
        fs::create_directories(path_);

        if (restoreRemoteFiles()) restoreGitState();

        watcher_ = std::make_unique<watcher::SmartFileWatcher>(
            path_, [this](const std::set<std::string>& changes) { onFilesChanged(changes); }, options_.watcher);
        watcher_->start();

        backupService_ = std::make_unique<BackupService>([this] { createBackup(); }, options_.backup_interval);
        backupService_->start();
    } catch (const std::exception& e) {
        LogRegistry::wsync()->error("[WorkspaceManager] Initialization failed: {}", e.what());
        stopServices();
        watcher_.reset();
        backupService_.reset();
        setState(ManagerState::UNINITIALIZED);
        throw;
    }

    initialized_ = true;

    bool abandoned = false;
    {
        std::scoped_lock lock(stateMutex_);
        // finalSync() may have been called from another thread while we were restoring
        if (shutdownInProgress_) abandoned = true;
        else state_ = ManagerState::RUNNING;
    }

    if (abandoned) {
        LogRegistry::wsync()->warn("[WorkspaceManager] Shutdown requested during initialization, stopping services");
        stopServices();
        setState(ManagerState::STOPPED);
        return;
    }

    LogRegistry::wsync()->info("[WorkspaceManager] Workspace ready, watching {}", path_.string());
}

bool WorkspaceManager::restoreRemoteFiles() {
    const auto prefix = layout_.filesPrefix();
    bool found = false;
    try {
        found = storage_->exists(prefix);
        if (!found) {
            LogRegistry::sync()->info("[WorkspaceManager] No remote workspace at {}, starting empty", prefix);
            return false;
        }

        LogRegistry::sync()->info("[WorkspaceManager] Restoring workspace from {}", prefix);
        storage_->downloadDirectory(prefix, path_);
        LogRegistry::sync()->info("[WorkspaceManager] Workspace restored into {}", path_.string());
    } catch (const StorageError& e) {
        if (e.isFatal()) throw;
        LogRegistry::sync()->error("[WorkspaceManager] Restore from {} failed ({}), continuing with local state: {}",
                                   prefix, to_string(e.kind()), e.what());
    }
    return found;
}

void WorkspaceManager::restoreGitState() {
    if (!options_.git_enabled) {
        LogRegistry::git()->warn("[WorkspaceManager] Git support disabled, not restoring repository state");
        return;
    }

    const GitState git(path_, options_.git_executable);
    if (git.hasRepository()) {
        LogRegistry::git()->info("[WorkspaceManager] Repository already present in {}, keeping it", path_.string());
        return;
    }

    if (!util::executableAvailable(options_.git_executable)) {
        LogRegistry::git()->warn("[WorkspaceManager] '{}' not found, skipping repository restore", options_.git_executable);
        return;
    }

    const auto key = layout_.gitBundleKey();
    try {
        if (!storage_->exists(key)) {
            LogRegistry::git()->debug("[WorkspaceManager] No git bundle at {}", key);
            return;
        }

        const util::TempFile bundle(".bundle");
        storage_->downloadFile(key, bundle.path());
        git.restoreFromBundle(bundle.path());
        LogRegistry::git()->info("[WorkspaceManager] Repository restored from {}", key);
    } catch (const std::exception& e) {
        LogRegistry::git()->warn("[WorkspaceManager] Failed to restore repository from {}: {}", key, e.what());
    }
}

void WorkspaceManager::preserveGitState() {
    if (!options_.git_enabled) return;

    const GitState git(path_, options_.git_executable);
    if (!git.hasRepository()) return;

    if (!util::executableAvailable(options_.git_executable)) {
        LogRegistry::git()->warn("[WorkspaceManager] '{}' not found, repository state will not be preserved",
                                 options_.git_executable);
        return;
    }

    const auto key = layout_.gitBundleKey();
    try {
        const util::TempFile bundle(".bundle");
        git.createBundle(bundle.path());
        storage_->uploadFile(bundle.path(), key);
        LogRegistry::git()->info("[WorkspaceManager] Repository state preserved at {}", key);
    } catch (const std::exception& e) {
        LogRegistry::git()->warn("[WorkspaceManager] Failed to preserve repository state: {}", e.what());
    }
}

void WorkspaceManager::onFilesChanged(const std::set<std::string>& changes) {
    // Batches dispatched while shutting down still go out, the watcher has already cleared them
    if (state() == ManagerState::STOPPED) {
        LogRegistry::sync()->debug("[WorkspaceManager] Manager stopped, skipping {} changes", changes.size());
        return;
    }
    if (changes.empty()) return;

    std::scoped_lock lock(syncMutex_);

    std::atomic<size_t> uploaded{0}, deleted{0};
    size_t rejected = 0;

    concurrency::TransferBatch batch(*transferPool_);
    for (const auto& rel : changes) {
        std::string key;
        try {
            key = layout_.fileKey(rel);
        } catch (const IsolationError& e) {
            LogRegistry::sync()->error("[WorkspaceManager] Refusing to sync '{}': {}", rel, e.what());
            ++rejected;
            continue;
        }

        batch.add(rel, [this, local = path_ / rel, key, &uploaded, &deleted] {
            std::error_code ec;
            if (fs::is_regular_file(local, ec)) {
                try {
                    storage_->uploadFile(local, key);
                    ++uploaded;
                    return;
                } catch (const StorageError& e) {
                    // removed between the check and the upload: fall through to delete
                    if (!e.isNotFound() || fs::exists(local, ec)) throw;
                }
            }
            storage_->deleteFile(key);
            ++deleted;
        });
    }

    const auto outcomes = batch.wait();
    const auto failures = concurrency::TransferBatch::describeFailures(outcomes);
    for (const auto& f : failures) LogRegistry::sync()->error("[WorkspaceManager] Sync failed for {}", f);

    if (failures.empty() && rejected == 0)
        LogRegistry::sync()->info("[WorkspaceManager] Synced {} changes ({} uploaded, {} deleted)",
                                  changes.size(), uploaded.load(), deleted.load());
    else
        LogRegistry::sync()->warn("[WorkspaceManager] Synced {} of {} changes ({} uploaded, {} deleted, {} failed, {} rejected)",
                                  uploaded.load() + deleted.load(), changes.size(), uploaded.load(), deleted.load(),
                                  failures.size(), rejected);
}

bool WorkspaceManager::includeInFullSync(const std::string& relPath) const {
    return !watchRules_.isIgnored(relPath) && !fullSyncRules_.isIgnored(relPath);
}

void WorkspaceManager::uploadAllLocked() {
    storage_->uploadDirectory(path_, layout_.filesPrefix(),
                              [this](const std::string& rel) { return includeInFullSync(rel); });
}

void WorkspaceManager::createBackupLocked() {
    const auto key = layout_.backupKey();
    storage_->createBackupArchive(path_, key, archiver_);
    LogRegistry::backup()->info("[WorkspaceManager] Compressed backup stored at {}", key);
}

void WorkspaceManager::createBackup() {
    std::scoped_lock lock(syncMutex_);
    createBackupLocked();
}

void WorkspaceManager::manualSync() {
    if (state() != ManagerState::RUNNING) {
        LogRegistry::sync()->info("[WorkspaceManager] Manual sync ignored, manager is {}", to_string(state()));
        return;
    }

    LogRegistry::sync()->info("[WorkspaceManager] Manual sync requested");
    watcher_->triggerImmediateSync();

    std::scoped_lock lock(syncMutex_);
    try {
        uploadAllLocked();
        LogRegistry::sync()->info("[WorkspaceManager] Manual sync completed");
    } catch (const std::exception& e) {
        LogRegistry::sync()->error("[WorkspaceManager] Manual sync failed: {}", e.what());
    }
}

void WorkspaceManager::finalSync() {
    if (shutdownInProgress_.exchange(true)) {
        LogRegistry::wsync()->info("[WorkspaceManager] Final sync already in progress or done");
        return;
    }

    ManagerState prev;
    {
        std::scoped_lock lock(stateMutex_);
        prev = state_;
        // INITIALIZING is finished off by initialize() itself once it sees the shutdown flag
        if (prev == ManagerState::RUNNING) state_ = ManagerState::SHUTTING_DOWN;
        else if (prev != ManagerState::INITIALIZING) state_ = ManagerState::STOPPED;
    }

    if (prev != ManagerState::RUNNING) {
        LogRegistry::wsync()->info("[WorkspaceManager] Final sync skipped, manager was {}", to_string(prev));
        return;
    }

    LogRegistry::wsync()->info("[WorkspaceManager] Starting final sync for conversation {}", layout_.conversationId());

    if (watcher_) watcher_->triggerImmediateSync();
    stopServices();

    {
        std::scoped_lock lock(syncMutex_);
        bool backedUp = false;
        bool failed = false;

        preserveGitState();

        try {
            createBackupLocked();
            backedUp = true;
        } catch (const std::exception& e) {
            failed = true;
            LogRegistry::backup()->error("[WorkspaceManager] Final backup failed: {}", e.what());
        }

        try {
            uploadAllLocked();
        } catch (const std::exception& e) {
            failed = true;
            LogRegistry::sync()->error("[WorkspaceManager] Final upload failed: {}", e.what());
        }

        if (!failed) {
            LogRegistry::wsync()->info("[WorkspaceManager] Final sync completed for conversation {}",
                                       layout_.conversationId());
        } else if (!backedUp) {
            try {
                createBackupLocked();
                LogRegistry::sync()->warn("[WorkspaceManager] Emergency backup uploaded");
            } catch (const std::exception& emergency) {
                LogRegistry::sync()->critical("[WorkspaceManager] Emergency backup failed, changes in {} may be lost: {}",
                                              path_.string(), emergency.what());
            }
        } else {
            LogRegistry::sync()->warn("[WorkspaceManager] Final sync incomplete, the compressed backup holds the latest state");
        }
    }

    setState(ManagerState::STOPPED);
}

void WorkspaceManager::stopServices() {
    if (watcher_) watcher_->stop();
    if (backupService_) backupService_->stop();
}

ManagerStatus WorkspaceManager::status() const {
    ManagerStatus s;
    s.conversation_id = layout_.conversationId();
    s.user_id = layout_.userId();
    s.workspace_path = path_.string();
    s.state = state();
    s.is_initialized = initialized_.load();
    s.shutdown_in_progress = shutdownInProgress_.load();
    s.files_prefix = layout_.filesPrefix();
    s.compressed_prefix = layout_.compressedPrefix();
    s.git_bundle_key = layout_.gitBundleKey();
    if (initialized_ && watcher_) s.watcher = watcher_->status();
    return s;
}
