#pragma once

#include "platform_services.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace goapagent::platform {

// Fixed set of workers running one process per task. Workers share the
// queue with the pool, so a task may drop the last reference to the pool
// that runs it.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Exceptions thrown by `task` surface from the future.
    // Throws std::runtime_error once the pool is shut down.
    std::future<void> run(std::function<void()> task);

    size_t size() const { return workers_.size(); }

    size_t pending() const;

    // Finishes queued tasks and joins every worker except the calling one,
    // which is detached and exits after its current task
    void shutdown();

private:
    struct Queue {
        std::mutex mutex;
        std::condition_variable ready;
        std::deque<std::packaged_task<void()>> tasks;
        bool stopping = false;
    };

    static void work(std::shared_ptr<Queue> queue);

    std::shared_ptr<Queue> queue_;
    std::vector<std::thread> workers_;
};

// Asyncer backed by a ThreadPool
class ThreadPoolAsyncer : public Asyncer {
public:
    explicit ThreadPoolAsyncer(size_t num_threads) : pool_(num_threads) {}

    std::future<void> async(std::function<void()> task) override {
        return pool_.run(std::move(task));
    }

    size_t size() const { return pool_.size(); }

private:
    ThreadPool pool_;
};

}  // namespace goapagent::platform
