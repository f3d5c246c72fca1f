#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Counting semaphore that admits waiters strictly in arrival order.
class ConcurrencyGate {
public:
    explicit ConcurrencyGate(std::size_t max);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    void acquire();
    void release();

    std::size_t capacity() const { return max_; }
    std::size_t held() const;
    std::size_t waiting() const;

    // Scoped slot; released on destruction.
    class Permit {
    public:
        explicit Permit(ConcurrencyGate& gate) : gate_(&gate) { gate_->acquire(); }
        ~Permit() { if (gate_) gate_->release(); }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit(Permit&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Permit& operator=(Permit&&) = delete;

    private:
        ConcurrencyGate* gate_;
    };

private:
    struct Waiter {
        std::condition_variable cv;
        bool granted = false;
    };

    const std::size_t max_;
    mutable std::mutex mtx_;
    std::size_t held_ = 0;
    std::deque<Waiter*> waiters_;
};
