#pragma once

#include "config/Config.hpp"
#include "storage/BackupArchiver.hpp"
#include "storage/WorkspaceStorage.hpp"
#include "watcher/IgnoreRules.hpp"
#include "watcher/types.hpp"
#include "workspace/RemoteLayout.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <nlohmann/json_fwd.hpp>

namespace wsync::watcher { class SmartFileWatcher; }
namespace wsync::concurrency { class ThreadPool; }

namespace wsync::workspace {

class BackupService;

enum class ManagerState { UNINITIALIZED, INITIALIZING, RUNNING, SHUTTING_DOWN, STOPPED };

std::string_view to_string(ManagerState state);

struct ManagerOptions {
    config::WatcherConfig watcher;
    std::chrono::seconds backup_interval{300};
    bool git_enabled = true;
    std::string git_executable = "git";
    std::string tar_executable = "tar";
    std::vector<std::string> backup_excludes = config::WorkspaceConfig::defaultBackupExcludes();
    unsigned int transfer_concurrency = 10;

    static ManagerOptions fromConfig(const config::Config& cfg);
};

struct ManagerStatus {
    std::string conversation_id;
    std::string user_id;
    std::string workspace_path;
    ManagerState state = ManagerState::UNINITIALIZED;
    bool is_initialized = false;
    bool shutdown_in_progress = false;
    std::string files_prefix;
    std::string compressed_prefix;
    std::string git_bundle_key;
    std::optional<watcher::WatcherStatus> watcher;
};

void to_json(nlohmann::json& j, const ManagerStatus& s);

// Keeps one conversation's workspace directory mirrored to remote storage.
//
// initialize() restores the remote copy (files, then git history) and starts the
// watcher and the periodic backup service. Every debounced batch of changes is pushed
// to storage; finalSync() flushes, snapshots git, writes a last compressed backup and
// uploads the whole tree before the container goes away.
//
// All storage mutations go through syncMutex_, so change batches, manual syncs,
// periodic backups and the final sync never overlap.
class WorkspaceManager {
public:
    WorkspaceManager(std::shared_ptr<storage::WorkspaceStorage> storage,
                     std::string conversationId,
                     std::string userId,
                     std::filesystem::path workspacePath,
                     ManagerOptions options = {});

    ~WorkspaceManager();

    WorkspaceManager(const WorkspaceManager&) = delete;
    WorkspaceManager& operator=(const WorkspaceManager&) = delete;

    // No-op with a warning when already initialized. PermissionDenied and Configuration
    // errors propagate and leave the manager UNINITIALIZED; any other restore failure is
    // logged and the manager starts from what is on disk.
    void initialize();

    // Flushes pending watcher changes, then uploads the whole tree. No-op unless RUNNING.
    void manualSync();

    // Idempotent. Ends in STOPPED whatever happens along the way.
    void finalSync();

    void cleanup() { finalSync(); }

    // Upload or delete each changed path. Failures are logged per path, never thrown.
    void onFilesChanged(const std::set<std::string>& changes);

    // Compressed backup of the workspace, serialized with every other sync. Throws on failure.
    void createBackup();

    [[nodiscard]] ManagerStatus status() const;
    [[nodiscard]] ManagerState state() const;
    [[nodiscard]] bool isInitialized() const { return initialized_.load(); }
    [[nodiscard]] bool shutdownInProgress() const { return shutdownInProgress_.load(); }

    [[nodiscard]] const RemoteLayout& layout() const { return layout_; }
    [[nodiscard]] const std::filesystem::path& workspacePath() const { return path_; }
    [[nodiscard]] const storage::BackupArchiver& archiver() const { return archiver_; }

    // Whether a full upload includes `relPath`: only paths the watcher tracks, minus
    // .git internals and backup noise, so every uploaded file has its deletion seen.
    [[nodiscard]] bool includeInFullSync(const std::string& relPath) const;

private:
    std::shared_ptr<storage::WorkspaceStorage> storage_;
    RemoteLayout layout_;
    std::filesystem::path path_;
    ManagerOptions options_;
    storage::BackupArchiver archiver_;
    watcher::IgnoreRules fullSyncRules_;
    watcher::IgnoreRules watchRules_;
    std::unique_ptr<concurrency::ThreadPool> transferPool_;

    mutable std::mutex stateMutex_;
    ManagerState state_ = ManagerState::UNINITIALIZED;
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdownInProgress_{false};

    std::mutex syncMutex_;

    std::unique_ptr<watcher::SmartFileWatcher> watcher_;
    std::unique_ptr<BackupService> backupService_;

    void setState(ManagerState s);

    // Both expect syncMutex_ held
    void uploadAllLocked();
    void createBackupLocked();

    // True when a remote copy existed, even if parts of it failed to download
    bool restoreRemoteFiles();
    void restoreGitState();
    void preserveGitState();
    void stopServices();
};

}
