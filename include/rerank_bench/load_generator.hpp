#pragma once

#include "rerank_bench/call_executor.hpp"
#include "rerank_bench/config.hpp"

#include <chrono>
#include <cstddef>
#include <vector>

namespace rerank_bench {

struct RunResult {
    std::vector<CallOutcome> outcomes;
    std::chrono::nanoseconds wall_time{0};
    std::size_t setup_failures = 0;     // workers aborted because no handle could be built
};

/*
Drives `concurrency` parallel workers, each issuing `calls_per_worker` sequential calls.

Handle contract: every worker owns exactly one handle, minted for the generator's
ClientConfig through ClientPool::CreateDetached() and released when the worker ends.
Handles are never shared between workers; the underlying client keeps per-connection
state that must not see concurrent callers. A worker reuses its handle across all of
its calls.

Outcomes keep issuance order within a worker; nothing is promised across workers.
*/
class LoadGenerator {
public:
    LoadGenerator(ClientPool& pool, ClientConfig cfg);

    // Synchronous calls on the pool's shared handle; results are discarded and
    // failures only logged. Returns the number of failed warm-up calls.
    std::size_t Warmup(std::size_t count, const Operation& op);

    RunResult Run(std::size_t concurrency, std::size_t calls_per_worker, const Operation& op);

    const ClientConfig& Config() const noexcept { return cfg_; }

private:
    std::vector<CallOutcome> RunWorker(std::size_t worker, std::size_t calls, const Operation& op);

    ClientPool& pool_;
    ClientConfig cfg_;
};

}
