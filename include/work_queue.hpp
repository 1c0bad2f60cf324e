#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

// Bounded producer/consumer queue. close() lets consumers drain what is left
// and then makes pop() fail.
template <typename T>
class WorkQueue {
public:
    explicit WorkQueue(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

    // Waits at most `wait` for room. Returns false on timeout or when closed,
    // leaving `item` untouched.
    bool push(T&& item, std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, wait, [this] { return closed_ || items_.size() < capacity_; }))
            return false;
        if (closed_) return false;
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Waits at most `wait` for an item. Returns false on timeout or when
    // closed and empty.
    bool pop(T& out, std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, wait, [this] { return closed_ || !items_.empty(); }))
            return false;
        if (items_.empty()) return false;
        out = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed_and_empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && items_.empty();
    }

private:
    std::size_t capacity_;
    std::deque<T> items_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
};
