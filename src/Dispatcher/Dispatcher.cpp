#include "Dispatcher.hpp"
#include "Logger.hpp"
#include <stdexcept>
#include <string>
#include <utility>


// Desc: run one action, logging anything it throws
// In: int log_fd, std::function<void()>& action
// Out: void
static void run_action(int log_fd, std::function<void()>& action) {
    try {
        if (action) action();
    } catch (const std::exception& e) {
        log_line(log_fd, "Dispatcher", std::string("action failed: ") + e.what());
    }
}


ThreadDispatcher::ThreadDispatcher(int log_fd) : log_fd_(log_fd) {
    thread_ = std::thread(&ThreadDispatcher::loop, this);
}

ThreadDispatcher::~ThreadDispatcher() {
    stop();
}

void ThreadDispatcher::post(std::function<void()> action) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!stopping_) {
            queue_.push_back(std::move(action));
            cv_.notify_one();
            return;
        }
    }
    run_action(log_fd_, action);
}


// Desc: dispatcher thread body
// In: (none)
// Out: void (returns after stop() once the queue is empty)
void ThreadDispatcher::loop() {
    for (;;) {
        std::function<void()> action;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [&]{ return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            action = std::move(queue_.front());
            queue_.pop_front();
            running_action_ = true;
        }
        run_action(log_fd_, action);
        action = nullptr; // captured resources are released on this thread
        {
            std::lock_guard<std::mutex> lk(mu_);
            running_action_ = false;
        }
        idle_cv_.notify_all();
    }
}

void ThreadDispatcher::flush() {
    if (std::this_thread::get_id() == thread_.get_id()) return;
    std::unique_lock<std::mutex> lk(mu_);
    idle_cv_.wait(lk, [&]{ return queue_.empty() && !running_action_; });
}

void ThreadDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    idle_cv_.notify_all();
}


void ManualDispatcher::post(std::function<void()> action) {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.push_back(std::move(action));
}

size_t ManualDispatcher::drain() {
    size_t ran = 0;
    for (;;) {
        std::function<void()> action;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (queue_.empty()) break;
            action = std::move(queue_.front());
            queue_.pop_front();
        }
        run_action(log_fd_, action);
        ++ran;
    }
    return ran;
}

size_t ManualDispatcher::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    return queue_.size();
}
