#include "rerank_bench/thread_pool.hpp"
#include "rerank_bench/logger.hpp"

namespace rerank_bench {

ThreadPool::ThreadPool(std::size_t threads, std::size_t queue_cap)
    : threads_(threads == 0 ? 1 : threads), queue_(queue_cap) {}

ThreadPool::~ThreadPool() {
    Stop(StopMode::Graceful);
}

void ThreadPool::Start() {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (state_.load(std::memory_order_acquire) != PoolState::CREATED) {
        throw std::runtime_error("ThreadPool can only be started once");
    }
    try {
        workers_.reserve(threads_);
        for (std::size_t i = 0; i < threads_; ++i) {
            workers_.emplace_back(&ThreadPool::WorkerLoop, this);
        }
    } catch (const std::exception& e) {
        RB_LOG_ERROR("thread pool start failed after {}/{} workers: {}",
                     workers_.size(), threads_, e.what());
        queue_.Close();
        JoinWorkers();
        state_.store(PoolState::STOPPED, std::memory_order_release);
        throw;
    }
    state_.store(PoolState::RUNNING, std::memory_order_release);
    RB_LOG_DEBUG("thread pool started with {} workers", threads_);
}

void ThreadPool::Stop(StopMode mode) {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    const auto state = state_.load(std::memory_order_acquire);
    if (state == PoolState::STOPPED) {
        return;
    }
    if (state == PoolState::CREATED) {
        queue_.Close();
        state_.store(PoolState::STOPPED, std::memory_order_release);
        return;
    }

    state_.store(PoolState::STOPPING, std::memory_order_release);
    if (mode == StopMode::Force) {
        const auto dropped = queue_.Clear();
        cancelled_.fetch_add(dropped, std::memory_order_relaxed);
        if (dropped > 0) {
            RB_LOG_WARN("thread pool force stop dropped {} queued tasks", dropped);
        }
    }
    queue_.Close();
    JoinWorkers();
    state_.store(PoolState::STOPPED, std::memory_order_release);
    RB_LOG_DEBUG("thread pool stopped");
}

void ThreadPool::JoinWorkers() {
    for (auto& w : workers_) {
        if (w.joinable()) {
            w.join();
        }
    }
    workers_.clear();
}

void ThreadPool::Enqueue(Task task) {
    if (state_.load(std::memory_order_acquire) != PoolState::RUNNING) {
        throw std::runtime_error("ThreadPool is not running");
    }
    if (!queue_.WaitPush(std::move(task))) {
        throw std::runtime_error("ThreadPool is stopping, task rejected");
    }
    submitted_.fetch_add(1, std::memory_order_relaxed);
}

// Submit() wraps every task in a packaged_task, so nothing escapes task().
void ThreadPool::WorkerLoop() {
    Task task;
    while (queue_.WaitPop(task)) {
        task();
        task = nullptr;
        completed_.fetch_add(1, std::memory_order_relaxed);
    }
}

ThreadPoolStatistics ThreadPool::GetStatistics() const noexcept {
    ThreadPoolStatistics s;
    s.statistic_total_submitted = submitted_.load(std::memory_order_relaxed);
    s.statistic_total_completed = completed_.load(std::memory_order_relaxed);
    s.statistic_total_cancelled = cancelled_.load(std::memory_order_relaxed);
    return s;
}

}
