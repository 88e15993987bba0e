#pragma once

#include "rerank_bench/call_executor.hpp"
#include "rerank_bench/config.hpp"
#include "rerank_bench/load_generator.hpp"
#include "rerank_bench/stats.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace bench_rb {

// Parses a positive decimal count. Signs, trailing characters, zero and values that
// do not fit std::size_t are rejected.
std::optional<std::size_t> ParseCount(const std::string& text);

// Runs a rerank and a score scenario for every configured concurrency level.
class RerankBenchmark {
public:
    RerankBenchmark(const rerank_bench::BenchmarkConfig& cfg, rerank_bench::ClientPool& pool);

    // Warm-up, then each level in order. Summaries are printed as they complete.
    std::vector<rerank_bench::ScenarioSummary> RunAll(std::ostream& os);

    // Rerank scenario first, then score.
    std::vector<rerank_bench::ScenarioSummary> RunLevel(std::size_t concurrency);

    // Fail with ValidationError on an empty rerank list or a score count mismatch.
    rerank_bench::Operation RerankOperation() const;
    rerank_bench::Operation ScoreOperation() const;

    const std::vector<std::string>& Documents() const noexcept { return docs_; }

    static std::vector<std::string> MakeDocs(std::size_t n);

private:
    rerank_bench::ScenarioSummary RunScenario(const std::string& kind,
                                              std::size_t concurrency,
                                              const rerank_bench::Operation& op);

    rerank_bench::BenchmarkConfig cfg_;
    std::vector<std::string> docs_;
    rerank_bench::LoadGenerator generator_;
};

}
