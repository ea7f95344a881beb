#include "concurrency/ThreadPool.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>

using namespace wsync::concurrency;
using namespace wsync::logging;

ThreadPool::ThreadPool(const unsigned int nThreads, std::string name)
    : name_(std::move(name)) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool requires at least one worker");
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.exchange(true)) return;
        std::queue<std::shared_ptr<Task>> empty;
        std::swap(queue, empty);
    }
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("[" + name_ + "] submit() after stop()");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (!task) continue;
            try {
                (*task)();
            } catch (const std::exception& e) {
                if (LogRegistry::isInitialized())
                    LogRegistry::wsync()->error("[{}] Task threw: {}", name_, e.what());
            } catch (...) {
                if (LogRegistry::isInitialized())
                    LogRegistry::wsync()->error("[{}] Task threw a non-standard exception", name_);
            }
        }
    });
}
