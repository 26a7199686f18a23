#pragma once
// Bounds concurrent decodes.
#include <mutex>
#include <condition_variable>

class SimpleSemaphore {
public:
    explicit SimpleSemaphore(int count) : count_(count > 0 ? count : 1) {}
    void acquire() {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&]{ return count_ > 0; });
        --count_;
    }
    void release() {
        std::lock_guard<std::mutex> lk(m_);
        ++count_;
        cv_.notify_one();
    }
private:
    std::mutex m_;
    std::condition_variable cv_;
    int count_;
};

// Holds one slot for the lifetime of the scope.
class SemaphoreSlot {
public:
    explicit SemaphoreSlot(SimpleSemaphore& sem) : sem_(sem) { sem_.acquire(); }
    ~SemaphoreSlot() { sem_.release(); }
    SemaphoreSlot(const SemaphoreSlot&) = delete;
    SemaphoreSlot& operator=(const SemaphoreSlot&) = delete;
private:
    SimpleSemaphore& sem_;
};
