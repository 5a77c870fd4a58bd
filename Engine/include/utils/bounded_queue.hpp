#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>

namespace Meisai {

/**
 * @brief Bounded multi-producer / multi-consumer queue.
 *
 * push() blocks while the queue is full (backpressure) and returns false
 * once closed. The push overload taking a predicate also gives up when the
 * predicate turns true; wake_producers() makes blocked producers re-check
 * it. pop() blocks while empty; after close() it keeps draining queued items
 * and returns false when none remain.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
        queue_.push(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    template <typename GiveUp>
    bool push(T item, GiveUp give_up) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [&] { return closed_ || queue_.size() < capacity_ || give_up(); });
        if (closed_ || queue_.size() >= capacity_) return false;
        queue_.push(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Never blocks: when full, the oldest item is dropped to make room.
     */
    bool push_latest(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        if (queue_.size() >= capacity_) queue_.pop();
        queue_.push(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    void wake_producers() {
        std::lock_guard<std::mutex> lock(mutex_);
        not_full_.notify_all();
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop();
        not_full_.notify_one();
        return true;
    }

    bool try_pop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop();
        not_full_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const noexcept { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::queue<T> queue_;
    size_t capacity_;
    bool closed_ = false;
};

} // namespace Meisai
