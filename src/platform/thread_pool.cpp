#include "goapagent/platform/thread_pool.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace goapagent::platform {

ThreadPool::ThreadPool(size_t num_threads)
    : queue_(std::make_shared<Queue>())
{
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPool::work, queue_);
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::work(std::shared_ptr<Queue> queue) {
    while (true) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue->mutex);
            queue->ready.wait(lock, [&queue] {
                return queue->stopping || !queue->tasks.empty();
            });
            if (queue->tasks.empty()) {
                return;
            }
            task = std::move(queue->tasks.front());
            queue->tasks.pop_front();
        }

        // Exceptions land in the task's future
        task();
    }
}

std::future<void> ThreadPool::run(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    auto result = packaged.get_future();
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        if (queue_->stopping) {
            throw std::runtime_error("ThreadPool is stopped");
        }
        queue_->tasks.push_back(std::move(packaged));
    }
    queue_->ready.notify_one();
    return result;
}

size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(queue_->mutex);
    return queue_->tasks.size();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        if (queue_->stopping) {
            return;
        }
        queue_->stopping = true;
    }
    queue_->ready.notify_all();

    auto self = std::this_thread::get_id();
    for (auto& worker : workers_) {
        if (!worker.joinable()) {
            continue;
        }
        if (worker.get_id() == self) {
            spdlog::debug("Thread pool shut down from its own worker: detaching it");
            worker.detach();
        } else {
            worker.join();
        }
    }
}

}  // namespace goapagent::platform
