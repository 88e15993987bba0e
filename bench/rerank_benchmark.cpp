#include "rerank_benchmark.hpp"

#include "rerank_bench/errors.hpp"
#include "rerank_bench/logger.hpp"
#include "rerank_bench/reporter.hpp"
#include "rerank_bench/scoring_client.hpp"

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <system_error>
#include <string>

namespace bench_rb {

using namespace rerank_bench;

std::optional<std::size_t> ParseCount(const std::string& text) {
    std::size_t value = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last || value == 0) {
        return std::nullopt;
    }
    return value;
}

RerankBenchmark::RerankBenchmark(const BenchmarkConfig& cfg, ClientPool& pool)
    : cfg_(cfg), docs_(MakeDocs(cfg.n_docs)), generator_(pool, cfg.client) {}

std::vector<std::string> RerankBenchmark::MakeDocs(std::size_t n) {
    static const std::array<const char*, 5> base = {
        "Shanghai is a large city in China.",
        "The capital of China is Beijing.",
        "Guangzhou is a major city in southern China.",
        "China has a long history and rich culture.",
        "Beijing is known for the Forbidden City.",
    };
    std::vector<std::string> docs;
    docs.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        docs.push_back(fmt::format("{} (doc_id={})", base[i % base.size()], i));
    }
    return docs;
}

Operation RerankBenchmark::RerankOperation() const {
    RerankRequest req;
    req.query = cfg_.query;
    req.documents = docs_;
    if (cfg_.top_n > 0) {
        req.top_n = cfg_.top_n;
    }
    req.timeout = cfg_.client.Timeout();
    return [req](ClientHandle& client) {
        auto result = Rerank(client, req);
        if (result.ranked.empty()) {
            throw ValidationError("empty rerank result");
        }
    };
}

Operation RerankBenchmark::ScoreOperation() const {
    ScoreRequest req;
    req.query = cfg_.query;
    req.documents = docs_;
    req.model = cfg_.model;
    req.timeout = cfg_.client.Timeout();
    return [req](ClientHandle& client) {
        auto result = Score(client, req);
        if (result.scores.size() != req.documents.size()) {
            throw ValidationError(fmt::format("score len mismatch: {} != {}",
                                              result.scores.size(), req.documents.size()));
        }
    };
}

std::vector<ScenarioSummary> RerankBenchmark::RunAll(std::ostream& os) {
    RB_LOG_INFO("benchmark against {} ({} docs, {} calls per worker, warm-up {})",
                cfg_.client.Endpoint(), docs_.size(), cfg_.requests_per_user, cfg_.warmup);

    // Serial warm-up to keep cold-start cost out of the first scenario.
    const auto rerank_warm_fail = generator_.Warmup(cfg_.warmup, RerankOperation());
    const auto score_warm_fail = generator_.Warmup(cfg_.warmup, ScoreOperation());
    if (rerank_warm_fail + score_warm_fail > 0) {
        RB_LOG_WARN("warm-up: {} rerank and {} score calls failed", rerank_warm_fail, score_warm_fail);
    }

    std::vector<ScenarioSummary> all;
    for (auto conc : cfg_.concurrency_levels) {
        for (auto& s : RunLevel(conc)) {
            PrintSummary(os, s);
            all.push_back(std::move(s));
        }
        os << std::string(110, '-') << '\n';
        os.flush();
    }
    return all;
}

std::vector<ScenarioSummary> RerankBenchmark::RunLevel(std::size_t concurrency) {
    std::vector<ScenarioSummary> out;
    out.push_back(RunScenario("rerank", concurrency, RerankOperation()));
    out.push_back(RunScenario("score ", concurrency, ScoreOperation()));
    return out;
}

ScenarioSummary RerankBenchmark::RunScenario(const std::string& kind,
                                             std::size_t concurrency,
                                             const Operation& op) {
    const auto total = concurrency * cfg_.requests_per_user;
    RB_PERF_SCOPE(fmt::format("scenario {} conc={}", kind, concurrency));

    auto run = generator_.Run(concurrency, cfg_.requests_per_user, op);
    if (run.setup_failures > 0) {
        RB_LOG_ERROR("{} conc={}: {} of {} workers could not create a client",
                     kind, concurrency, run.setup_failures, concurrency);
    }
    return StatsAggregator::Summarize(
        fmt::format("{} | conc={} | total={}", kind, concurrency, total), run.outcomes, run.wall_time);
}

}
