#include "watcher/SmartFileWatcher.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <unordered_set>
#include <nlohmann/json.hpp>

using namespace wsync::watcher;
using namespace wsync::logging;
namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace wsync::watcher {

void to_json(nlohmann::json& j, const WatcherStatus& s) {
    j = {
        {"is_running", s.running},
        {"pending_changes", s.pending_changes},
        {"current_debounce", s.current_debounce},
        {"changes_per_second", s.changes_per_second},
        {"tracked_files", s.tracked_files},
        {"watch_directory", s.watch_directory}
    };
}

}

SmartFileWatcher::SmartFileWatcher(fs::path watchDirectory, ChangeCallback onChange, config::WatcherConfig cfg)
    : AsyncService("SmartFileWatcher"),
      root_(std::move(watchDirectory)),
      onChange_(std::move(onChange)),
      cfg_(std::move(cfg)),
      rules_(cfg_.ignore_patterns, cfg_.ignore_hidden) {
    cfg_.validate();
    if (!onChange_) throw std::invalid_argument("SmartFileWatcher requires a change callback");
    debounce_.current_debounce = cfg_.min_debounce;

    LogRegistry::watcher()->info("[SmartFileWatcher] Initialized for {} (debounce {}-{}ms, poll {}ms)",
                                 root_.string(), cfg_.min_debounce.count(), cfg_.max_debounce.count(),
                                 cfg_.poll_interval.count());
}

SmartFileWatcher::~SmartFileWatcher() {
    stop();
}

void SmartFileWatcher::start() {
    if (isRunning()) {
        LogRegistry::watcher()->warn("[SmartFileWatcher] Already running");
        return;
    }

    {
        std::scoped_lock lock(scanMutex_);
        const auto baseline = scanDirectory(root_, rules_, fileState_);
        LogRegistry::watcher()->info("[SmartFileWatcher] Baseline scan found {} existing files", fileState_.size());
        if (baseline.root_missing)
            LogRegistry::watcher()->warn("[SmartFileWatcher] Watch directory {} does not exist yet", root_.string());
    }

    {
        std::scoped_lock lock(mutex_);
        timerStop_ = false;
    }
    timerThread_ = std::thread(&SmartFileWatcher::timerLoop, this);

    AsyncService::start();
    LogRegistry::watcher()->info("[SmartFileWatcher] Started watching {}", root_.string());
}

void SmartFileWatcher::stop() {
    const bool wasActive = isRunning() || timerThread_.joinable();

    AsyncService::stop();

    {
        std::scoped_lock lock(mutex_);
        timerStop_ = true;
        cancelLocked();
    }
    timerCv_.notify_all();
    if (timerThread_.joinable() && timerThread_.get_id() != std::this_thread::get_id()) timerThread_.join();

    if (wasActive) LogRegistry::watcher()->info("[SmartFileWatcher] Stopped watching {}", root_.string());
}

void SmartFileWatcher::runLoop() {
    while (!shouldStop()) {
        try {
            scanOnce();
        } catch (const std::exception& e) {
            LogRegistry::watcher()->error("[SmartFileWatcher] Poll tick failed: {}", e.what());
        }
        lazySleep(cfg_.poll_interval);
    }
}

size_t SmartFileWatcher::scanOnce() {
    ScanResult result;
    {
        std::scoped_lock lock(scanMutex_);
        result = scanDirectory(root_, rules_, fileState_);
    }
    if (result.empty()) return 0;

    for (const auto& p : result.created) LogRegistry::watcher()->debug("[SmartFileWatcher] New file detected: {}", p);
    for (const auto& p : result.modified) LogRegistry::watcher()->debug("[SmartFileWatcher] Modified file detected: {}", p);
    for (const auto& p : result.deleted) LogRegistry::watcher()->debug("[SmartFileWatcher] Deleted file detected: {}", p);

    std::scoped_lock lock(mutex_);
    pending_.insert(result.created.begin(), result.created.end());
    pending_.insert(result.modified.begin(), result.modified.end());
    pending_.insert(result.deleted.begin(), result.deleted.end());

    const auto before = debounce_.current_debounce;
    updateDebounce(debounce_, result.total(), Clock::now(), cfg_);
    if (debounce_.current_debounce > before)
        LogRegistry::watcher()->info("[SmartFileWatcher] High activity detected ({:.0f} changes/s), debounce now {}ms",
                                     debounce_.changes_per_second, debounce_.current_debounce.count());

    scheduleLocked();
    return result.total();
}

ScanResult SmartFileWatcher::scanDirectory(const fs::path& root, const IgnoreRules& rules, FileState& state) {
    ScanResult out;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        // Leave state alone so a transiently missing root does not look like mass deletion
        out.root_missing = true;
        return out;
    }

    std::unordered_set<std::string> seen;
    seen.reserve(state.size());

    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        LogRegistry::watcher()->error("[SmartFileWatcher] Cannot scan {}: {}", root.string(), ec.message());
        out.root_missing = true;
        return out;
    }

    while (it != fs::recursive_directory_iterator()) {
        const auto rel = it->path().lexically_relative(root).generic_string();
        if (!rel.empty()) {
            if (it->is_directory(ec)) {
                if (rules.isIgnored(rel)) it.disable_recursion_pending();
            } else if (it->is_regular_file(ec) && !rules.isIgnored(rel)) {
                const auto mtime = it->last_write_time(ec);
                // A file that vanished between listing and stat stays unseen, i.e. deleted
                if (!ec) {
                    seen.insert(rel);
                    if (const auto found = state.find(rel); found == state.end()) {
                        state.emplace(rel, mtime);
                        out.created.push_back(rel);
                    } else if (mtime > found->second) {
                        found->second = mtime;
                        out.modified.push_back(rel);
                    }
                }
            }
        }
        ec.clear();

        it.increment(ec);
        if (ec) {
            // Incomplete walk: skip deletion detection rather than report false deletions
            LogRegistry::watcher()->error("[SmartFileWatcher] Scan of {} aborted: {}", root.string(), ec.message());
            return out;
        }
    }

    for (auto iter = state.begin(); iter != state.end();) {
        if (!seen.contains(iter->first)) {
            out.deleted.push_back(iter->first);
            iter = state.erase(iter);
        } else {
            ++iter;
        }
    }

    return out;
}

void SmartFileWatcher::updateDebounce(DebounceState& st, const size_t numChanges, const Clock::time_point now,
                                      const config::WatcherConfig& cfg) {
    if (st.last_change_time && now - *st.last_change_time < std::chrono::seconds(1))
        st.changes_per_second += static_cast<double>(numChanges);
    else
        st.changes_per_second = static_cast<double>(numChanges);

    st.last_change_time = now;

    const auto cur = static_cast<double>(st.current_debounce.count());
    if (st.changes_per_second > cfg.burst_threshold) {
        const auto grown = std::chrono::milliseconds(static_cast<int64_t>(cur * cfg.growth_factor));
        st.current_debounce = std::min(grown, cfg.max_debounce);
    } else {
        const auto decayed = std::chrono::milliseconds(static_cast<int64_t>(cur * cfg.decay_factor));
        st.current_debounce = std::max(decayed, cfg.min_debounce);
    }

    st.current_debounce = std::clamp(st.current_debounce, cfg.min_debounce, cfg.max_debounce);
}

void SmartFileWatcher::scheduleLocked() {
    deadline_ = Clock::now() + debounce_.current_debounce;
    ++generation_;
    timerCv_.notify_all();
}

void SmartFileWatcher::cancelLocked() {
    deadline_.reset();
    ++generation_;
    timerCv_.notify_all();
}

void SmartFileWatcher::timerLoop() {
    std::unique_lock lock(mutex_);
    while (!timerStop_) {
        if (!deadline_) {
            timerCv_.wait(lock, [this] { return timerStop_ || deadline_.has_value(); });
            continue;
        }

        const auto gen = generation_;
        const auto when = *deadline_;
        if (timerCv_.wait_until(lock, when, [this, gen] { return timerStop_ || generation_ != gen; }))
            continue; // stopped, cancelled or rescheduled

        deadline_.reset();
        if (pending_.empty() || dispatching_) continue;

        std::set<std::string> batch;
        batch.swap(pending_);
        dispatching_ = true;

        lock.unlock();
        LogRegistry::watcher()->info("[SmartFileWatcher] Triggering sync for {} changed files", batch.size());
        const bool ok = dispatch(batch, "debounced");
        lock.lock();

        dispatching_ = false;
        if (!ok && !timerStop_) scheduleLocked();
        dispatchCv_.notify_all();
    }
}

bool SmartFileWatcher::dispatch(const std::set<std::string>& batch, const char* trigger) {
    try {
        onChange_(batch);
        return true;
    } catch (const std::exception& e) {
        LogRegistry::watcher()->error("[SmartFileWatcher] Error in {} change callback, re-queueing {} paths: {}",
                                      trigger, batch.size(), e.what());
    }

    std::scoped_lock lock(mutex_);
    pending_.insert(batch.begin(), batch.end());
    return false;
}

void SmartFileWatcher::triggerImmediateSync() {
    if (!isRunning()) return;

    LogRegistry::watcher()->info("[SmartFileWatcher] Manual sync trigger requested");

    std::set<std::string> batch;
    {
        std::unique_lock lock(mutex_);
        cancelLocked();
        dispatchCv_.wait(lock, [this] { return !dispatching_; });
        dispatching_ = true;
    }

    try {
        scanOnce();
    } catch (const std::exception& e) {
        LogRegistry::watcher()->error("[SmartFileWatcher] Final scan before manual sync failed: {}", e.what());
    }

    {
        std::scoped_lock lock(mutex_);
        cancelLocked(); // scanOnce() may have rescheduled
        batch.swap(pending_);
    }

    bool ok = true;
    if (batch.empty()) {
        LogRegistry::watcher()->debug("[SmartFileWatcher] Manual sync requested but no pending changes");
    } else {
        LogRegistry::watcher()->info("[SmartFileWatcher] Manual sync triggered for {} files", batch.size());
        ok = dispatch(batch, "manual");
    }

    std::scoped_lock lock(mutex_);
    dispatching_ = false;
    if (ok) debounce_.current_debounce = cfg_.min_debounce;
    // failed paths, or changes the poll loop queued meanwhile, go out on the normal timer
    if (!pending_.empty()) scheduleLocked();
    dispatchCv_.notify_all();
}

WatcherStatus SmartFileWatcher::status() const {
    WatcherStatus s;
    s.running = isRunning();
    s.watch_directory = root_.string();
    {
        std::scoped_lock lock(scanMutex_);
        s.tracked_files = fileState_.size();
    }
    std::scoped_lock lock(mutex_);
    s.pending_changes = pending_.size();
    s.current_debounce = static_cast<double>(debounce_.current_debounce.count()) / 1000.0;
    s.changes_per_second = debounce_.changes_per_second;
    return s;
}
