#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "watcher/IgnoreRules.hpp"
#include "watcher/types.hpp"

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace wsync::watcher {

// Polls a directory tree and hands batches of changed relative paths to a callback
// once activity settles. The settle delay adapts: bursts stretch it towards
// max_debounce, quiet periods shrink it back to min_debounce.
//
// Threads: the poll loop (AsyncService worker) and a timer thread that fires the
// debounced dispatch. The callback always runs without the watcher's lock held and
// never concurrently with itself.
class SmartFileWatcher : public concurrency::AsyncService {
public:
    using ChangeCallback = std::function<void(const std::set<std::string>&)>;

    SmartFileWatcher(std::filesystem::path watchDirectory, ChangeCallback onChange,
                     config::WatcherConfig cfg = {});

    ~SmartFileWatcher() override;

    // Records the current tree as the baseline (not reported) and starts polling.
    void start() override;

    // Cancels the pending dispatch and joins both threads. Pending paths are kept.
    void stop() override;

    // Cancel the timer, rescan, and run the callback now on the caller's thread.
    // Failures are logged and the paths re-queued. No effect when not running.
    void triggerImmediateSync();

    // One poll tick on the caller's thread: scan, adapt debounce, reschedule.
    // Returns the number of changed paths found.
    size_t scanOnce();

    [[nodiscard]] WatcherStatus status() const;

    [[nodiscard]] const std::filesystem::path& watchDirectory() const { return root_; }
    [[nodiscard]] const IgnoreRules& ignoreRules() const { return rules_; }

    // Walks `root`, diffs against `state` and updates it in place.
    static ScanResult scanDirectory(const std::filesystem::path& root, const IgnoreRules& rules, FileState& state);

    // Adds `numChanges` to the per-second rate (restarting it when the previous
    // change is a second or more old) and grows or decays the debounce.
    static void updateDebounce(DebounceState& st, size_t numChanges,
                               std::chrono::steady_clock::time_point now, const config::WatcherConfig& cfg);

protected:
    void runLoop() override;

private:
    std::filesystem::path root_;
    ChangeCallback onChange_;
    config::WatcherConfig cfg_;
    IgnoreRules rules_;

    mutable std::mutex scanMutex_;      // guards fileState_
    FileState fileState_;

    mutable std::mutex mutex_;          // guards everything below
    std::condition_variable timerCv_;
    std::condition_variable dispatchCv_;
    std::set<std::string> pending_;
    DebounceState debounce_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    uint64_t generation_ = 0;
    bool timerStop_ = false;
    bool dispatching_ = false;
    std::thread timerThread_;

    void timerLoop();
    void scheduleLocked();
    void cancelLocked();

    // Runs the callback; on failure merges `batch` back into pending_.
    bool dispatch(const std::set<std::string>& batch, const char* trigger);
};

}
