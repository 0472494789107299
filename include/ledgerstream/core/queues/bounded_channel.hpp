#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace LedgerStream {

/**
 * @class BoundedChannel
 * @brief Blocking MPMC queue with a hard capacity and explicit close.
 *
 * A full channel blocks the producer (never drops). close() ends the channel
 * for both sides: blocked pushes return false immediately, pops drain what is
 * left and then return std::nullopt.
 */
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /**
     * @brief Enqueue @p item, waiting while the channel is full.
     * @param waited_ns if non-null, receives the nanoseconds spent blocked (0 if none)
     * @return false if the channel was closed before the item could be queued
     */
    bool push(T item, uint64_t* waited_ns = nullptr) {
        std::unique_lock<std::mutex> lock(m_);
        uint64_t waited = 0;
        if (!closed_ && dq_.size() >= capacity_) {
            auto start = std::chrono::steady_clock::now();
            not_full_.wait(lock, [&]() { return closed_ || dq_.size() < capacity_; });
            waited = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - start).count());
        }
        if (waited_ns) {
            *waited_ns = waited;
        }
        if (closed_) {
            return false;
        }
        dq_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Wait for the next item; std::nullopt once closed and drained
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_);
        not_empty_.wait(lock, [&]() { return closed_ || !dq_.empty(); });
        return takeLocked(lock);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return dq_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    std::optional<T> takeLocked(std::unique_lock<std::mutex>& lock) {
        if (dq_.empty()) {
            return std::nullopt;
        }
        std::optional<T> item(std::move(dq_.front()));
        dq_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex m_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> dq_;
    bool closed_ = false;
};

} // namespace LedgerStream
