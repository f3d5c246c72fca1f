#include "concurrency_gate.hpp"

#include <stdexcept>

ConcurrencyGate::ConcurrencyGate(std::size_t max) : max_(max) {
    if (max_ == 0) throw std::invalid_argument("ConcurrencyGate needs at least one slot");
}

void ConcurrencyGate::acquire() {
    std::unique_lock<std::mutex> lk(mtx_);
    if (held_ < max_ && waiters_.empty()) {
        ++held_;
        return;
    }
    Waiter self;
    waiters_.push_back(&self);
    // release() hands its slot over directly, so held_ is already counted for us
    self.cv.wait(lk, [&]{ return self.granted; });
}

void ConcurrencyGate::release() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!waiters_.empty()) {
        Waiter* next = waiters_.front();
        waiters_.pop_front();
        next->granted = true;
        next->cv.notify_one();
        return;
    }
    if (held_ > 0) --held_;
}

std::size_t ConcurrencyGate::held() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return held_;
}

std::size_t ConcurrencyGate::waiting() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return waiters_.size();
}
