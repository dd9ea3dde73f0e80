#pragma once

#include <chrono>
#include <condition_variable> // For std::condition_variable
#include <cstdint>
#include <mutex>              // For std::mutex, std::unique_lock
#include <optional>
#include <queue>
#include <stdexcept>          // For std::invalid_argument
#include <utility>            // For std::move

/**
 * @brief One successful request, as seen by the worker that issued it.
 */
struct RequestEvent {
    int worker_id = 0;
    int status_code = 0;
    std::chrono::system_clock::time_point timestamp{};
};

/**
 * @brief A thread-safe, fixed-capacity FIFO channel.
 *
 * Producers never wait: TryPush() drops the item when the channel is full
 * or closed. Consumers may block in Pop() for a bounded time. Closing the
 * channel discards anything still queued and wakes every consumer.
 */
template <typename T>
class BoundedChannel {
public:
    /**
     * @param capacity Maximum number of queued items. Must be greater than 0.
     */
    explicit BoundedChannel(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("Channel capacity must be greater than 0");
        }
    }

    // Delete copy operations
    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /**
     * @brief Enqueues an item without ever blocking on space.
     * @return false if the item was dropped (channel full or closed).
     */
    bool TryPush(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_ || queue_.size() >= capacity_) {
            ++dropped_;
            return false;
        }
        queue_.push(std::move(item));

        // Unlock before notifying
        lock.unlock();
        condition_.notify_one();
        return true;
    }

    /**
     * @brief Dequeues an item, waiting up to `timeout` for one to arrive.
     * @return The item, or std::nullopt on timeout or once the channel is closed.
     */
    template <typename Rep, typename Period>
    std::optional<T> Pop(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait_for(lock, timeout, [this]() { return closed_ || !queue_.empty(); });
        return take_front();
    }

    /**
     * @brief Dequeues an item if one is immediately available.
     */
    std::optional<T> TryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return take_front();
    }

    /**
     * @brief Closes the channel. Pending items are discarded.
     */
    void Close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            std::queue<T>().swap(queue_);
        }
        condition_.notify_all();
    }

    bool IsClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t Capacity() const { return capacity_; }

    /**
     * @brief Number of items rejected by TryPush() so far.
     */
    uint64_t DroppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    // Caller holds mutex_.
    std::optional<T> take_front() {
        if (closed_ || queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    const size_t capacity_;
    bool closed_ = false;
    uint64_t dropped_ = 0;

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
};

using EventChannel = BoundedChannel<RequestEvent>;
