#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

// Cooperative cancellation. A source issues tokens; cancelling the source
// wakes every token sleeping in sleep_for().
class CancellationToken {
public:
    CancellationToken() = default;   // never cancelled

    bool is_cancelled() const;

    // Sleeps up to ms milliseconds. Returns false if cancelled before or during the wait.
    bool sleep_for(int ms) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex m;
        std::condition_variable cv;
    };
    explicit CancellationToken(std::shared_ptr<State> st) : state_(std::move(st)) {}

    std::shared_ptr<State> state_;
    friend class CancellationSource;
};

class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }
    void cancel();
    bool is_cancelled() const { return state_->cancelled.load(); }

private:
    std::shared_ptr<CancellationToken::State> state_;
};
