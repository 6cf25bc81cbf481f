#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace micsync {
namespace runtime {

/**
 * @brief Fixed pool of worker threads running named tasks in FIFO order
 *
 * submit() never blocks. stop() refuses new work, lets the workers finish
 * what is already queued and joins them. Tasks run with no lock held.
 */
class TaskQueue {
public:
    using Task = std::function<void()>;

    explicit TaskQueue(size_t workers, const std::string &name = "tasks");
    ~TaskQueue();

    TaskQueue(const TaskQueue &) = delete;
    TaskQueue &operator=(const TaskQueue &) = delete;

    // False once stop() has been called
    bool submit(const std::string &task_name, Task task);

    void stop();

    bool is_running() const { return running_.load(); }
    size_t pending() const;
    size_t active() const { return active_.load(); }
    size_t worker_count() const { return workers_.size(); }

private:
    struct Item {
        std::string name;
        Task task;
    };

    void worker_loop(size_t index);

    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Item> queue_;

    std::atomic<bool> running_{true};
    std::atomic<size_t> active_{0};
    std::vector<std::thread> workers_;
};

}  // namespace runtime
}  // namespace micsync
