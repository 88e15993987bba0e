#include "rerank_bench/load_generator.hpp"
#include "rerank_bench/client_pool.hpp"
#include "rerank_bench/errors.hpp"
#include "rerank_bench/logger.hpp"
#include "rerank_bench/thread_pool.hpp"

#include <future>
#include <iterator>

namespace rerank_bench {

namespace {
constexpr std::size_t kReserveLimit = std::size_t{1} << 20;
}

LoadGenerator::LoadGenerator(ClientPool& pool, ClientConfig cfg)
    : pool_(pool), cfg_(std::move(cfg)) {}

std::size_t LoadGenerator::Warmup(std::size_t count, const Operation& op) {
    if (count == 0) {
        return 0;
    }
    std::shared_ptr<ClientHandle> handle;
    try {
        handle = pool_.Acquire(cfg_);
    } catch (const ClientCreationError& e) {
        RB_LOG_WARN("warm-up skipped, no client for {}: {}", cfg_.Endpoint(), e.what());
        return count;
    }

    std::size_t failed = 0;
    for (std::size_t i = 0; i < count; ++i) {
        auto outcome = CallExecutor::Execute(*handle, op);
        if (!outcome.success) {
            ++failed;
            RB_LOG_WARN("warm-up call {}/{} failed: {}", i + 1, count, outcome.error.value_or(""));
        }
    }
    return failed;
}

RunResult LoadGenerator::Run(std::size_t concurrency, std::size_t calls_per_worker, const Operation& op) {
    RunResult result;
    if (concurrency == 0 || calls_per_worker == 0) {
        return result;
    }
    // Reserve only for realistic shapes; the product may not even fit in size_t.
    if (calls_per_worker <= kReserveLimit / concurrency) {
        result.outcomes.reserve(concurrency * calls_per_worker);
    }

    const auto t0 = std::chrono::steady_clock::now();
    ThreadPool workers(concurrency, concurrency);
    try {
        workers.Start();
    } catch (const std::exception& e) {
        result.setup_failures = concurrency;
        result.wall_time = std::chrono::steady_clock::now() - t0;
        RB_LOG_ERROR("cannot start {} workers: {}", concurrency, e.what());
        return result;
    }

    std::vector<std::future<std::vector<CallOutcome>>> futures;
    futures.reserve(concurrency);
    for (std::size_t w = 0; w < concurrency; ++w) {
        futures.push_back(workers.Submit([this, w, calls_per_worker, &op] {
            return RunWorker(w, calls_per_worker, op);
        }));
    }

    for (auto& fut : futures) {
        try {
            auto part = fut.get();
            result.outcomes.insert(result.outcomes.end(),
                                   std::make_move_iterator(part.begin()),
                                   std::make_move_iterator(part.end()));
        } catch (const std::exception& e) {
            ++result.setup_failures;
            RB_LOG_ERROR("worker aborted during setup: {}", e.what());
        }
    }
    result.wall_time = std::chrono::steady_clock::now() - t0;
    workers.Stop(StopMode::Graceful);

    const auto stats = workers.GetStatistics();
    RB_LOG_DEBUG("run finished: {} outcomes from {}/{} workers in {}ms",
                 result.outcomes.size(), stats.statistic_total_completed, stats.statistic_total_submitted,
                 std::chrono::duration_cast<std::chrono::milliseconds>(result.wall_time).count());
    return result;
}

std::vector<CallOutcome> LoadGenerator::RunWorker(std::size_t worker, std::size_t calls, const Operation& op) {
    auto handle = pool_.CreateDetached(cfg_);

    std::vector<CallOutcome> out;
    out.reserve(calls);
    for (std::size_t i = 0; i < calls; ++i) {
        out.push_back(CallExecutor::Execute(*handle, op));
    }

    auto r = handle->Release();
    if (!r) {
        RB_LOG_WARN("worker {}: client release failed: {}", worker, r.message);
    }
    return out;
}

}
