#include "rerank_bench/reporter.hpp"

#include <fmt/format.h>

namespace rerank_bench {

namespace {

std::string Millis(const std::optional<double>& v) {
    return v ? fmt::format("{:.1f}ms", *v) : std::string("n/a");
}

}

std::string FormatSummary(const ScenarioSummary& s) {
    std::string line = fmt::format(
        "[{}] ok={}/{} succ={:.1f}% rps={:.2f} avg={} p50={} p95={} p99={} max={}",
        s.label, s.succeeded, s.total, s.success_rate * 100.0, s.throughput,
        Millis(s.mean_ms), Millis(s.p50_ms), Millis(s.p95_ms), Millis(s.p99_ms), Millis(s.max_ms));
    if (s.sample_error) {
        line += fmt::format("\n  err_sample: {}", *s.sample_error);
    }
    return line;
}

void PrintSummary(std::ostream& os, const ScenarioSummary& s) {
    os << FormatSummary(s) << '\n';
}

}
