#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief Shutdown request shared by the signal handler and the publish loop
 *
 * request_from_signal() only touches a lock-free atomic and is safe inside a
 * signal handler. request() additionally wakes threads blocked in
 * wait_until(). Waits are sliced so a signal-only request is seen within
 * one slice.
 */
class Interrupt {
public:
    explicit Interrupt(std::chrono::milliseconds slice = std::chrono::milliseconds(50))
        : slice_(slice) {}

    Interrupt(const Interrupt&) = delete;
    Interrupt& operator=(const Interrupt&) = delete;

    void request() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            flag_.store(true);
        }
        cv_.notify_all();
    }

    void request_from_signal() {
        flag_.store(true);
    }

    bool requested() const {
        return flag_.load();
    }

    void reset() {
        flag_.store(false);
    }

    /**
     * @brief Sleep until a time point unless interrupted first
     * @return true if the deadline was reached, false if interrupted
     */
    template<typename Clock, typename Duration>
    bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) const {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!flag_.load()) {
            auto now = Clock::now();
            if (now >= deadline) {
                return true;
            }
            auto wake = std::min<std::chrono::time_point<Clock, Duration>>(
                deadline, std::chrono::time_point_cast<Duration>(now + slice_));
            cv_.wait_until(lock, wake);
        }
        return false;
    }

    /**
     * @brief Sleep for a duration unless interrupted first
     * @return true if the full duration elapsed
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& d) const {
        return wait_until(std::chrono::steady_clock::now() + d);
    }

private:
    std::atomic<bool> flag_{false};
    std::chrono::milliseconds slice_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};
