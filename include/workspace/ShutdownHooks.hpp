#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace wsync::workspace {

// Work that must run once before the process exits: the daemon registers each
// manager's finalSync() here. Hooks run on a helper thread under a deadline so an
// unreachable storage backend cannot hold the process hostage.
//
// Signal handlers only raise flags; the host loop polls them and calls runAll().
class ShutdownHooks {
public:
    using Hook = std::function<void()>;

    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};

    ShutdownHooks() = default;
    ~ShutdownHooks();

    ShutdownHooks(const ShutdownHooks&) = delete;
    ShutdownHooks& operator=(const ShutdownHooks&) = delete;

    // Process-wide registry used by the signal and atexit plumbing.
    static ShutdownHooks& instance();

    // Hooks registered after runAll() started are ignored with a warning.
    void registerHook(std::string name, Hook hook);

    // Runs every hook once, in registration order, and waits at most `timeout`.
    // Returns false if the deadline passed; the hooks keep running detached.
    // Later calls return immediately.
    bool runAll(std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool hasRun() const { return ran_.load(); }

    // SIGTERM/SIGINT raise the termination flag, SIGUSR1 the sync request flag.
    static void installSignalHandlers();

    // Runs instance().runAll(timeout) from std::atexit on normal exit.
    static void registerAtExit(std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    [[nodiscard]] static bool terminationRequested() { return terminate_.load(); }
    static void requestTermination() { terminate_.store(true); }

    // True once per SIGUSR1 (or requestSync()) since the last call.
    static bool takeSyncRequest() { return syncRequested_.exchange(false); }
    static void requestSync() { syncRequested_.store(true); }

    // Clears both flags.
    static void resetFlags();

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, Hook>> hooks_;
    std::atomic<bool> ran_{false};

    static inline std::atomic<bool> terminate_{false};
    static inline std::atomic<bool> syncRequested_{false};
    static inline std::chrono::milliseconds atExitTimeout_{DEFAULT_TIMEOUT};

    static void onSignal(int signum);
};

}
