#pragma once

#include "concurrency/AsyncService.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace wsync::workspace {

// Runs `backup` every `interval` until stopped. A failed run is logged and the loop carries on.
class BackupService : public concurrency::AsyncService {
public:
    BackupService(std::function<void()> backup, std::chrono::seconds interval);

    ~BackupService() override;

    [[nodiscard]] std::chrono::seconds interval() const { return interval_; }
    [[nodiscard]] uint64_t completedRuns() const { return completed_.load(); }
    [[nodiscard]] uint64_t failedRuns() const { return failed_.load(); }

protected:
    void runLoop() override;

private:
    std::function<void()> backup_;
    std::chrono::seconds interval_;
    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> failed_{0};
};

}
