#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

// Schedules work on the thread that owns display resources.
class Dispatcher {
public:
    virtual ~Dispatcher() = default;
    virtual void post(std::function<void()> action) = 0;
};

// One owned thread running posted actions in order.
class ThreadDispatcher : public Dispatcher {
public:
    explicit ThreadDispatcher(int log_fd = -1);
    ~ThreadDispatcher() override;
    ThreadDispatcher(const ThreadDispatcher&) = delete;
    ThreadDispatcher& operator=(const ThreadDispatcher&) = delete;

    void post(std::function<void()> action) override;

    // Blocks until every action posted so far has run.
    void flush();
    // Runs what is queued, then joins. Later posts run inline on the caller.
    void stop();

private:
    void loop();

    int log_fd_{-1};
    std::mutex mu_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_{false};
    bool running_action_{false};
    std::thread thread_;
};

// Queues actions until the owner drains them; used by tests and single-threaded hosts.
class ManualDispatcher : public Dispatcher {
public:
    explicit ManualDispatcher(int log_fd = -1) : log_fd_(log_fd) {}

    void post(std::function<void()> action) override;

    // Runs everything queued, including actions posted while draining.
    size_t drain();
    size_t pending() const;

private:
    int log_fd_{-1};
    mutable std::mutex mu_;
    std::deque<std::function<void()>> queue_;
};
