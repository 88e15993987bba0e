#pragma once

#include "rerank_bench/call_executor.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rerank_bench {

// Longest error text kept in ScenarioSummary::sample_error.
inline constexpr std::size_t kSampleErrorMax = 200;

// Latencies are in milliseconds. They are empty when no call succeeded.
struct ScenarioSummary {
    std::string label;
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    double success_rate = 0.0;
    double throughput = 0.0;            // outcomes per second of wall time

    std::optional<double> mean_ms;
    std::optional<double> p50_ms;
    std::optional<double> p95_ms;
    std::optional<double> p99_ms;
    std::optional<double> max_ms;

    std::optional<std::string> sample_error;
};

// Nearest-rank percentile over ascending `sorted`; p is clamped to [0, 100].
// The rank is ceil(p/100 * N) computed in integers with p resolved to 1e-6,
// so no float equality test decides it. Returns NaN for an empty input.
double Percentile(const std::vector<double>& sorted, double p);

class StatsAggregator {
public:
    static ScenarioSummary Summarize(const std::string& label,
                                     const std::vector<CallOutcome>& outcomes,
                                     std::chrono::nanoseconds wall_time);
};

}
