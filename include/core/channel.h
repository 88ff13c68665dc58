#pragma once

/**
 * @file channel.h
 * @brief Blocking multi-producer / single-consumer FIFO
 *
 * Used for:
 * - Trigger handoff from I/O callbacks to the transition handler
 * - The pending vehicle-command queue
 */

#include <deque>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

namespace cabin_voice {

/**
 * @brief Thread-safe FIFO channel
 *
 * Any number of threads may push; items are popped in push order.
 * Each pushed item is delivered at most once. After close(), push fails
 * and pop drains the remaining items before returning std::nullopt.
 */
template<typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueue an item
     * @return False if the channel is closed (item dropped)
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Block until an item is available or the channel is closed and empty
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        return take_locked();
    }

    /**
     * @brief Block up to timeout for an item
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        return take_locked();
    }

    /// Non-blocking pop
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_locked();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }

    /// Stop accepting items and wake every waiter
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    std::optional<T> take_locked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::deque<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace cabin_voice
