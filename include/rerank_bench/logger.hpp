#pragma once

#include "rerank_bench/fwd.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <string>
#include <utility>

namespace rerank_bench::log {

// Reads {"level", "pattern", "file"} from a JSON file. Missing or broken files
// fall back to an info-level colored console logger.
void InitializeLogger(const std::string& config_path);

void      SetLogger(LoggerPtr logger);
LoggerPtr LoadLogger();
void      SetLevel(const std::string& level);

// Logs "[perf] <name> took <ns>ns" at debug level on destruction.
class PerfScope {
public:
    explicit PerfScope(std::string name)
        : name_(std::move(name)), start_(std::chrono::steady_clock::now()) {}
    ~PerfScope() noexcept;

    PerfScope(const PerfScope&) = delete;
    PerfScope& operator=(const PerfScope&) = delete;

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_;
};

}

#define RB_LOG_IMPL(lvl, ...)                                              \
    do {                                                                   \
        auto rb_logger_ = ::rerank_bench::log::LoadLogger();               \
        if (rb_logger_ && rb_logger_->should_log(lvl)) {                   \
            rb_logger_->log(lvl, __VA_ARGS__);                             \
        }                                                                  \
    } while (0)

#define RB_LOG_TRACE(...) RB_LOG_IMPL(spdlog::level::trace, __VA_ARGS__)
#define RB_LOG_DEBUG(...) RB_LOG_IMPL(spdlog::level::debug, __VA_ARGS__)
#define RB_LOG_INFO(...)  RB_LOG_IMPL(spdlog::level::info, __VA_ARGS__)
#define RB_LOG_WARN(...)  RB_LOG_IMPL(spdlog::level::warn, __VA_ARGS__)
#define RB_LOG_ERROR(...) RB_LOG_IMPL(spdlog::level::err, __VA_ARGS__)

#define RB_PERF_CONCAT_INNER(a, b) a##b
#define RB_PERF_CONCAT(a, b) RB_PERF_CONCAT_INNER(a, b)

#define RB_PERF_SCOPE(name) \
    ::rerank_bench::log::PerfScope RB_PERF_CONCAT(rb_perf_scope_, __LINE__)(name)
