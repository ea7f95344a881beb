#pragma once

#include "storage/StorageError.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace wsync::storage {

// Retries an operation while it fails with a Transient StorageError.
struct RetryPolicy {
    unsigned int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{200};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{5000};

    // Injected by tests; defaults to std::this_thread::sleep_for.
    std::function<void(std::chrono::milliseconds)> sleeper;

    // Delay after the given failed attempt (1-based).
    [[nodiscard]] std::chrono::milliseconds backoffFor(const unsigned int attempt) const {
        double ms = static_cast<double>(initial_backoff.count());
        for (unsigned int i = 1; i < attempt; ++i) ms *= multiplier;
        const auto capped = std::min(ms, static_cast<double>(max_backoff.count()));
        return std::chrono::milliseconds(static_cast<long long>(capped));
    }

    template <typename Fn>
    auto run(const std::string& operation, Fn&& fn) const -> decltype(fn()) {
        const unsigned int attempts = std::max(1u, max_attempts);
        for (unsigned int attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const StorageError& e) {
                if (!e.isTransient() || attempt >= attempts) throw;

                const auto delay = backoffFor(attempt);
                if (logging::LogRegistry::isInitialized())
                    logging::LogRegistry::cloud()->warn("[RetryPolicy] {} failed (attempt {}/{}), retrying in {}ms: {}",
                                                        operation, attempt, attempts, delay.count(), e.what());
                if (sleeper) sleeper(delay);
                else std::this_thread::sleep_for(delay);
            }
        }
    }
};

}
