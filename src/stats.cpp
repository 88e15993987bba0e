#include "rerank_bench/stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>

namespace rerank_bench {

namespace {

constexpr std::uint64_t kMicroPercent = 1000000;            // p resolution: 1e-6
constexpr std::uint64_t kFullScale = 100 * kMicroPercent;   // p == 100

double ToMillis(std::chrono::nanoseconds d) {
    return std::chrono::duration<double, std::milli>(d).count();
}

}

double Percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (!(p > 0.0)) {
        return sorted.front();
    }
    if (p >= 100.0) {
        return sorted.back();
    }

    const std::uint64_t n = sorted.size();
    const std::uint64_t p_micro = static_cast<std::uint64_t>(std::llround(p * static_cast<double>(kMicroPercent)));
    // rank = ceil(p_micro * n / kFullScale)
    std::uint64_t rank = (p_micro * n + kFullScale - 1) / kFullScale;
    rank = std::clamp<std::uint64_t>(rank, 1, n);
    return sorted[rank - 1];
}

ScenarioSummary StatsAggregator::Summarize(const std::string& label,
                                           const std::vector<CallOutcome>& outcomes,
                                           std::chrono::nanoseconds wall_time) {
    ScenarioSummary s;
    s.label = label;
    s.total = outcomes.size();

    std::vector<double> lat;
    lat.reserve(outcomes.size());
    for (const auto& o : outcomes) {
        if (o.success) {
            lat.push_back(ToMillis(o.latency));
        } else if (!s.sample_error) {
            std::string err = o.error.value_or("");
            if (err.size() > kSampleErrorMax) {
                err.resize(kSampleErrorMax);
            }
            s.sample_error = std::move(err);
        }
    }
    std::sort(lat.begin(), lat.end());

    s.succeeded = lat.size();
    s.failed = s.total - s.succeeded;
    s.success_rate = s.total > 0 ? static_cast<double>(s.succeeded) / static_cast<double>(s.total) : 0.0;

    const double wall_s = std::chrono::duration<double>(wall_time).count();
    s.throughput = wall_s > 0.0 ? static_cast<double>(s.total) / wall_s : 0.0;

    if (!lat.empty()) {
        s.mean_ms = std::accumulate(lat.begin(), lat.end(), 0.0) / static_cast<double>(lat.size());
        s.p50_ms = Percentile(lat, 50);
        s.p95_ms = Percentile(lat, 95);
        s.p99_ms = Percentile(lat, 99);
        s.max_ms = lat.back();
    }
    return s;
}

}
