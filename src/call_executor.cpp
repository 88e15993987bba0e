#include "rerank_bench/call_executor.hpp"

#include <exception>

namespace rerank_bench {

CallOutcome CallExecutor::Execute(ClientHandle& handle, const Operation& op) noexcept {
    using clock = std::chrono::steady_clock;

    CallOutcome out;
    const auto t0 = clock::now();
    try {
        op(handle);
        out.latency = clock::now() - t0;
        out.success = true;
    } catch (const std::exception& e) {
        out.latency = clock::now() - t0;
        out.error = e.what();
    } catch (...) {
        out.latency = clock::now() - t0;
        out.error = "unknown error";
    }
    return out;
}

}
