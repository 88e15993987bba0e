#pragma once

#include "rerank_bench/blocking_queue.hpp"
#include "rerank_bench/fwd.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace rerank_bench {

enum class StopMode {
    Graceful,   // run everything already queued, then join
    Force       // drop queued tasks, join after the running ones return
};

enum class PoolState {
    CREATED,
    RUNNING,
    STOPPING,
    STOPPED
};

struct ThreadPoolStatistics {
    std::size_t statistic_total_submitted = 0;
    std::size_t statistic_total_completed = 0;
    std::size_t statistic_total_cancelled = 0;
};

// Fixed-size worker pool. Producers block while the queue is full.
class ThreadPool {
public:
    using Task = std::function<void()>;

    ThreadPool(std::size_t threads, std::size_t queue_cap);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Throws std::system_error when a worker cannot be spawned; workers already
    // running are joined first and the pool ends up STOPPED.
    void Start();
    void Stop(StopMode mode = StopMode::Graceful);

    // Exceptions thrown by f are delivered through the returned future.
    template <typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>> {
        using R = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;
        auto task = std::make_shared<std::packaged_task<R()>>(
            [fn = std::forward<F>(f), tup = std::make_tuple(std::forward<Args>(args)...)]() mutable -> R {
                return std::apply(std::move(fn), std::move(tup));
            });
        auto fut = task->get_future();
        Enqueue([task] { (*task)(); });
        return fut;
    }

    PoolState State() const noexcept { return state_.load(std::memory_order_acquire); }
    ThreadPoolStatistics GetStatistics() const noexcept;

private:
    void Enqueue(Task task);
    void WorkerLoop();
    void JoinWorkers();

    std::size_t threads_;
    BlockingQueue<Task> queue_;
    std::vector<std::thread> workers_;
    std::mutex lifecycle_mtx_;
    std::atomic<PoolState> state_{PoolState::CREATED};

    std::atomic<std::size_t> submitted_{0};
    std::atomic<std::size_t> completed_{0};
    std::atomic<std::size_t> cancelled_{0};
};

}
