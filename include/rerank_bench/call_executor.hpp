#pragma once

#include "rerank_bench/fwd.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace rerank_bench {

struct CallOutcome {
    bool success = false;
    std::chrono::nanoseconds latency{0};
    std::optional<std::string> error;
};

// One request/response cycle against a borrowed handle. Reports failure by throwing.
using Operation = std::function<void(ClientHandle&)>;

class CallExecutor {
public:
    // Times `op` with a monotonic clock and turns anything it throws into a failed
    // outcome. Nothing propagates past this call.
    static CallOutcome Execute(ClientHandle& handle, const Operation& op) noexcept;
};

}
