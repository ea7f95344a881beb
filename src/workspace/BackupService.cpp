#include "workspace/BackupService.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace wsync::workspace;
using namespace wsync::logging;

BackupService::BackupService(std::function<void()> backup, const std::chrono::seconds interval)
    : AsyncService("BackupService"), backup_(std::move(backup)), interval_(interval) {
    if (!backup_) throw std::invalid_argument("BackupService requires a backup function");
    if (interval_.count() <= 0) throw std::invalid_argument("Backup interval must be positive");
}

BackupService::~BackupService() {
    stop();
}

void BackupService::runLoop() {
    LogRegistry::backup()->info("[BackupService] Periodic backups every {}s", interval_.count());

    while (!shouldStop()) {
        lazySleep(interval_);
        if (shouldStop()) break;

        try {
            backup_();
            ++completed_;
        } catch (const std::exception& e) {
            ++failed_;
            LogRegistry::backup()->error("[BackupService] Periodic backup failed: {}", e.what());
        }
    }
}
