#pragma once

#include <memory>

namespace spdlog {
class logger;
}

namespace rerank_bench {

class ThreadPool;
enum class StopMode;
enum class PoolState;

class ClientConfig;
class ClientHandle;
class ClientPool;

struct CallOutcome;
struct ScenarioSummary;

using LoggerPtr = std::shared_ptr<spdlog::logger>;

}
