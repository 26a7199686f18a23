#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed pool of background workers draining a FIFO of tasks.
// Tasks that throw are logged and dropped; the worker keeps running.
class AsyncTaskQueue {
public:
    AsyncTaskQueue(size_t num_workers, int log_fd = -1, bool background_priority = true);
    ~AsyncTaskQueue();
    AsyncTaskQueue(const AsyncTaskQueue&) = delete;
    AsyncTaskQueue& operator=(const AsyncTaskQueue&) = delete;

    // false once shutdown() has started.
    bool post(std::function<void()> task);

    // Blocks until the queue is empty and no task is running.
    void wait_idle();

    // Runs what is already queued, then joins every worker. Idempotent.
    void shutdown();

    size_t pending() const;

private:
    void worker_loop();
    bool wait_dequeue(std::function<void()>& out);

    int log_fd_{-1};
    bool background_{true};
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> q_;
    size_t active_{0};
    bool shutdown_{false};
    std::vector<std::thread> workers_;
};
