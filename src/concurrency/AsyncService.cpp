#include "concurrency/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

using namespace wsync::concurrency;
using namespace wsync::logging;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    // Subclasses stop() in their own destructors so runLoop() never outlives their members.
    handleInterrupt();
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join(); // previous run ended on its own

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::wsync()->error("[{}] Service error: {}", serviceName_, e.what());
        } catch (...) {
            LogRegistry::wsync()->error("[{}] Service error: unknown exception.", serviceName_);
        }

        running_.store(false, std::memory_order_release);
    });

    LogRegistry::wsync()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    handleInterrupt();

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
        LogRegistry::wsync()->debug("[{}] Service stopped.", serviceName_);
    }

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
}

void AsyncService::handleInterrupt() {
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();
}
