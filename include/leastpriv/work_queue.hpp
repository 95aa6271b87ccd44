#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace leastpriv {

// ============================================================================
// Work Queue
// ============================================================================
//
// Unbounded multi-producer / multi-consumer FIFO. close() wakes every waiter;
// after it, pops drain the remaining items and then report end of stream.

template <typename T>
class WorkQueue {
public:
    WorkQueue() = default;
    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    // Returns false if the queue is closed
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_) return false;
            items_.emplace_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until an item is available or the queue is closed and empty
    std::optional<T> wait_pop() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return closed_ || !items_.empty(); });
        return take_locked();
    }

    // As wait_pop, but gives up after timeout
    template <typename Rep, typename Period>
    std::optional<T> wait_pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, timeout, [this] { return closed_ || !items_.empty(); });
        return take_locked();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lk(mtx_);
        return take_locked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Close and discard everything still queued
    void close_and_clear() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
            items_.clear();
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return items_.size();
    }

private:
    std::optional<T> take_locked() {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace leastpriv
