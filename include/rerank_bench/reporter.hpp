#pragma once

#include "rerank_bench/stats.hpp"

#include <ostream>
#include <string>

namespace rerank_bench {

// "[label] ok=S/T succ=R% rps=X avg=..ms p50=..ms p95=..ms p99=..ms max=..ms",
// followed by "\n  err_sample: ..." when any call failed. Absent latencies print "n/a".
std::string FormatSummary(const ScenarioSummary& s);

void PrintSummary(std::ostream& os, const ScenarioSummary& s);

}
