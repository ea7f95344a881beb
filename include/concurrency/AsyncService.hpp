#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace wsync::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    // Signals runLoop() to return and joins the worker.
    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Raises the stop flag and wakes lazySleep().
    void handleInterrupt();

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    // Sleeps for `d` or until stop() is called, whichever comes first.
    template <typename Rep, typename Period>
    void lazySleep(const std::chrono::duration<Rep, Period> d) {
        std::unique_lock lock(sleepMutex_);
        sleepCv_.wait_for(lock, d, [this] { return shouldStop(); });
    }

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
