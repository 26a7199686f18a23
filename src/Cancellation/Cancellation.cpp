#include "Cancellation.hpp"
#include <thread>


CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {}

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lk(state_->m);
        state_->cancelled.store(true);
    }
    state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
    return state_ && state_->cancelled.load();
}


// Desc: cancellable delay used at every prefetch suspension point
// In: int ms
// Out: bool (true if the full delay elapsed, false if cancelled)
bool CancellationToken::sleep_for(int ms) const {
    if (!state_) {
        if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        return true;
    }
    std::unique_lock<std::mutex> lk(state_->m);
    if (ms <= 0) return !state_->cancelled.load();
    const bool cancelled = state_->cv.wait_for(lk, std::chrono::milliseconds(ms),
                                               [&]{ return state_->cancelled.load(); });
    return !cancelled;
}
