#include "AsyncTaskQueue.hpp"
#include "Logger.hpp"
#include <utility>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sched.h>


#ifndef IOPRIO_CLASS_SHIFT
#define IOPRIO_CLASS_SHIFT 13
#define IOPRIO_CLASS_IDLE  3
#define IOPRIO_PRIO_VALUE(class_, data_) (((class_) << IOPRIO_CLASS_SHIFT) | (data_))
#define IOPRIO_WHO_PROCESS 1
#endif


// Desc: get current thread id (TID)
// In: (none)
// Out: pid_t
static inline pid_t gettid_wrap() {
    return static_cast<pid_t>(syscall(SYS_gettid));
}

// Desc: set I/O priority for a process/thread
// In: int which, int who, int ioprio
// Out: int (syscall result)
static inline int ioprio_set_wrap(int which, int who, int ioprio) {
    return syscall(SYS_ioprio_set, which, who, ioprio);
}

// Desc: lower thread CPU/I/O priority to background
// In: int log_fd
// Out: void
static void set_thread_background_mode(int log_fd) {
    // I/O priority = IDLE
    pid_t tid = gettid_wrap();
    const int io_idle = IOPRIO_PRIO_VALUE(IOPRIO_CLASS_IDLE, 0);
    if (ioprio_set_wrap(IOPRIO_WHO_PROCESS, tid, io_idle) != 0) {
        log_line(log_fd, "AsyncTaskQueue", std::string("ioprio_set(IDLE) failed: ") + strerror(errno));
    }

    // Try CPU policy = SCHED_IDLE
    struct sched_param sp; memset(&sp, 0, sizeof(sp));
    if (sched_setscheduler(0, SCHED_IDLE, &sp) != 0) {
        // fall back to nice = +19
        if (setpriority(PRIO_PROCESS, tid, 19) != 0) {
            log_line(log_fd, "AsyncTaskQueue", std::string("setpriority(+19) failed: ") + strerror(errno));
        }
    }
}


AsyncTaskQueue::AsyncTaskQueue(size_t num_workers, int log_fd, bool background_priority)
    : log_fd_(log_fd), background_(background_priority) {
    if (num_workers == 0) num_workers = 1;
    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        workers_.emplace_back(&AsyncTaskQueue::worker_loop, this);
    }
}

AsyncTaskQueue::~AsyncTaskQueue() {
    shutdown();
}


// Desc: enqueue a task
// In: std::function<void()> task
// Out: bool (false if the queue is shutting down)
bool AsyncTaskQueue::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (shutdown_) return false;
        q_.emplace_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}


// Desc: wait for and pop one task from queue
// In: std::function<void()>& out
// Out: bool (false if shutdown and empty)
bool AsyncTaskQueue::wait_dequeue(std::function<void()>& out) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [&]{ return shutdown_ || !q_.empty(); });
    if (shutdown_ && q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    ++active_;
    return true;
}


// Desc: worker loop running queued tasks at background priority
// In: (none)
// Out: void
void AsyncTaskQueue::worker_loop() {
    if (background_) set_thread_background_mode(log_fd_);
    for (;;) {
        std::function<void()> task;
        if (!wait_dequeue(task)) break;
        try {
            task();
        } catch (const std::exception& e) {
            log_line(log_fd_, "AsyncTaskQueue", std::string("task failed: ") + e.what());
        }
        task = nullptr;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            --active_;
        }
        idle_cv_.notify_all();
    }
}


void AsyncTaskQueue::wait_idle() {
    std::unique_lock<std::mutex> lk(mtx_);
    idle_cv_.wait(lk, [&]{ return q_.empty() && active_ == 0; });
}


// Desc: signal shutdown, let workers drain, join threads
// In: (none)
// Out: void
void AsyncTaskQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        shutdown_ = true;
    }
    cv_.notify_all();
    for (auto& th : workers_) {
        if (th.joinable() && th.get_id() != std::this_thread::get_id()) th.join();
    }
}

size_t AsyncTaskQueue::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return q_.size();
}
