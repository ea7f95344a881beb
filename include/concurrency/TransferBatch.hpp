#pragma once

#include "concurrency/ThreadPool.hpp"

#include <functional>
#include <future>
#include <string>
#include <vector>

namespace wsync::concurrency {

// A group of tasks fanned out on a ThreadPool and awaited together.
// wait() never throws for a task failure; each failure is reported in its outcome.
class TransferBatch {
public:
    explicit TransferBatch(ThreadPool& pool) : pool_(pool) {}

    void add(std::string label, std::function<void()> fn);

    std::vector<TaskOutcome> wait();

    [[nodiscard]] size_t size() const { return pending_.size() + rejected_.size(); }

    // Failed outcomes rendered as "label: reason".
    static std::vector<std::string> describeFailures(const std::vector<TaskOutcome>& outcomes);

private:
    ThreadPool& pool_;
    std::vector<std::pair<std::string, std::future<TaskOutcome>>> pending_;
    std::vector<TaskOutcome> rejected_;
};

}
