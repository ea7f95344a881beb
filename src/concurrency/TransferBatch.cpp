#include "concurrency/TransferBatch.hpp"

#include <stdexcept>

using namespace wsync::concurrency;

void TransferBatch::add(std::string label, std::function<void()> fn) {
    auto task = std::make_shared<FunctionTask>(label, std::move(fn));
    auto future = task->getFuture();
    try {
        pool_.submit(std::move(task));
    } catch (const std::runtime_error&) {
        // pool already stopped; the task never runs
        rejected_.push_back({std::move(label), std::current_exception()});
        return;
    }
    pending_.emplace_back(std::move(label), std::move(*future));
}

std::vector<TaskOutcome> TransferBatch::wait() {
    std::vector<TaskOutcome> outcomes = std::move(rejected_);
    rejected_.clear();
    outcomes.reserve(outcomes.size() + pending_.size());

    for (auto& [label, future] : pending_) {
        try {
            outcomes.push_back(future.get());
        } catch (const std::future_error&) {
            // pool was stopped before the task ran
            outcomes.push_back({label, std::make_exception_ptr(std::runtime_error("transfer cancelled"))});
        }
    }

    pending_.clear();
    return outcomes;
}

std::vector<std::string> TransferBatch::describeFailures(const std::vector<TaskOutcome>& outcomes) {
    std::vector<std::string> out;
    for (const auto& o : outcomes) {
        if (o.ok()) continue;
        try {
            std::rethrow_exception(o.error);
        } catch (const std::exception& e) {
            out.push_back(o.label + ": " + e.what());
        } catch (...) {
            out.push_back(o.label + ": unknown error");
        }
    }
    return out;
}
