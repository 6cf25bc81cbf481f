#include "task_queue.hpp"

#include <exception>

#include "logging/logger.hpp"

namespace micsync {
namespace runtime {

TaskQueue::TaskQueue(size_t workers, const std::string &name) : name_(name) {
    if (workers == 0) {
        workers = 1;
    }
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back(&TaskQueue::worker_loop, this, i);
    }
    LOG_DEBUG("[TaskQueue] " << name_ << " started with " << workers << " worker(s)");
}

TaskQueue::~TaskQueue() { stop(); }

bool TaskQueue::submit(const std::string &task_name, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            LOG_WARN("[TaskQueue] " << name_ << " stopped, rejecting task: " << task_name);
            return false;
        }
        queue_.push_back(Item{task_name, std::move(task)});
    }
    cv_.notify_one();
    return true;
}

void TaskQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }
    cv_.notify_all();

    for (auto &worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    LOG_DEBUG("[TaskQueue] " << name_ << " stopped");
}

size_t TaskQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskQueue::worker_loop(size_t index) {
    while (true) {
        Item item;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_.load(); });

            // Drain remaining work before exiting
            if (queue_.empty()) {
                return;
            }
            item = std::move(queue_.front());
            queue_.pop_front();
            active_++;
        }

        LOG_DEBUG("[TaskQueue] " << name_ << "#" << index << " running " << item.name);
        try {
            item.task();
        } catch (const std::exception &e) {
            LOG_ERROR("[TaskQueue] Task '" << item.name << "' threw: " << e.what());
        }
        active_--;
    }
}

}  // namespace runtime
}  // namespace micsync
