#include "workspace/ShutdownHooks.hpp"
#include "logging/LogRegistry.hpp"

#include <csignal>
#include <cstdlib>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace wsync::workspace;
using namespace wsync::logging;

static_assert(std::atomic<bool>::is_always_lock_free, "signal handlers need lock-free flags");

ShutdownHooks::~ShutdownHooks() {
    std::scoped_lock lock(mutex_);
    if (!ran_ && !hooks_.empty() && LogRegistry::isInitialized())
        LogRegistry::wsync()->warn("[ShutdownHooks] Destroyed with {} hooks that never ran", hooks_.size());
}

ShutdownHooks& ShutdownHooks::instance() {
    static ShutdownHooks hooks;
    return hooks;
}

void ShutdownHooks::registerHook(std::string name, Hook hook) {
    if (!hook) throw std::invalid_argument("Shutdown hook '" + name + "' is empty");

    std::scoped_lock lock(mutex_);
    if (ran_) {
        LogRegistry::wsync()->warn("[ShutdownHooks] Ignoring hook '{}' registered after shutdown began", name);
        return;
    }
    hooks_.emplace_back(std::move(name), std::move(hook));
}

size_t ShutdownHooks::size() const {
    std::scoped_lock lock(mutex_);
    return hooks_.size();
}

bool ShutdownHooks::runAll(const std::chrono::milliseconds timeout) {
    std::vector<std::pair<std::string, Hook>> hooks;
    {
        std::scoped_lock lock(mutex_);
        if (ran_.exchange(true)) return true;
        hooks.swap(hooks_);
    }

    if (hooks.empty()) return true;

    LogRegistry::wsync()->info("[ShutdownHooks] Running {} shutdown hooks (timeout {}ms)", hooks.size(), timeout.count());

    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();

    std::thread runner([hooks = std::move(hooks), done] {
        for (const auto& [name, hook] : hooks) {
            try {
                hook();
                LogRegistry::wsync()->debug("[ShutdownHooks] Hook '{}' finished", name);
            } catch (const std::exception& e) {
                LogRegistry::wsync()->error("[ShutdownHooks] Hook '{}' failed: {}", name, e.what());
            }
        }
        done->set_value();
    });

    if (finished.wait_for(timeout) == std::future_status::ready) {
        runner.join();
        LogRegistry::wsync()->info("[ShutdownHooks] All shutdown hooks completed");
        return true;
    }

    runner.detach();
    LogRegistry::wsync()->error("[ShutdownHooks] Shutdown hooks still running after {}ms, giving up on them",
                                timeout.count());
    return false;
}

void ShutdownHooks::onSignal(const int signum) {
    if (signum == SIGUSR1) syncRequested_.store(true);
    else terminate_.store(true);
}

void ShutdownHooks::installSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = &ShutdownHooks::onSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    for (const int sig : {SIGTERM, SIGINT, SIGUSR1})
        if (sigaction(sig, &sa, nullptr) != 0)
            throw std::runtime_error("sigaction failed for signal " + std::to_string(sig));
}

void ShutdownHooks::registerAtExit(const std::chrono::milliseconds timeout) {
    static std::once_flag once;
    atExitTimeout_ = timeout;
    std::call_once(once, [] {
        instance(); // constructed before the handler is registered, so destroyed after it runs
        if (std::atexit([] { instance().runAll(atExitTimeout_); }) != 0)
            throw std::runtime_error("std::atexit registration failed");
    });
}

void ShutdownHooks::resetFlags() {
    terminate_.store(false);
    syncRequested_.store(false);
}
