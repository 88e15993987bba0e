#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace rerank_bench {

// Bounded MPMC queue guarded by one mutex. Close() wakes every waiter; after it,
// pushes fail and pops drain what is left.
// A push that fails never consumes its argument.
template <typename T>
class BlockingQueue {
public:
    explicit BlockingQueue(std::size_t capacity)
        : capacity_(capacity < 1 ? 1 : capacity) {}

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    // Blocks while the queue is full. Returns false once the queue is closed.
    template <typename U>
    bool WaitPush(U&& item) {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            not_full_.wait(lk, [this] { return closed_ || items_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            items_.emplace_back(std::forward<U>(item));
        }
        not_empty_.notify_one();
        return true;
    }

    // Blocks until an item arrives or the queue is closed and empty.
    bool WaitPop(T& out) {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            not_empty_.wait(lk, [this] { return closed_ || !items_.empty(); });
            if (items_.empty()) {
                return false;
            }
            out = std::move(items_.front());
            items_.pop_front();
        }
        not_full_.notify_one();
        return true;
    }

    void Close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    // Drops every queued item; returns how many were dropped.
    std::size_t Clear() {
        std::deque<T> dropped;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            dropped.swap(items_);
        }
        not_full_.notify_all();
        return dropped.size();
    }

private:
    const std::size_t capacity_;
    std::mutex mtx_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

}
