#pragma once

#include "types.hpp"

#include <functional>
#include <future>
#include <optional>
#include <string>

namespace wsync::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Tasks that report an outcome hand out its future exactly once
    virtual std::optional<std::future<TaskOutcome>> getFuture() { return std::nullopt; }
};

struct PromisedTask : Task {
    std::promise<TaskOutcome> promise;

    std::optional<std::future<TaskOutcome>> getFuture() override { return promise.get_future(); }

    // Subclasses must fulfil the promise on every path, or the waiter sees broken_promise
    void operator()() override = 0;
};

// Runs a callable and reports its exception, if any, through the promise.
struct FunctionTask : PromisedTask {
    std::string label;
    std::function<void()> fn;

    FunctionTask(std::string label, std::function<void()> fn)
        : label(std::move(label)), fn(std::move(fn)) {}

    void operator()() override {
        TaskOutcome outcome{label, nullptr};
        // reported through the outcome, TransferBatch decides what to rethrow
        try {
            fn();
        } catch (...) {
            outcome.error = std::current_exception();
        }
        promise.set_value(std::move(outcome));
    }
};

}
