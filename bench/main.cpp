#include "rerank_benchmark.hpp"

#include "rerank_bench/client_pool.hpp"
#include "rerank_bench/config.hpp"
#include "rerank_bench/logger.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

struct Cli {
    std::string config_path{"config/benchmark_config.json"};
    std::string logger_path{"config/logger_config.json"};
    std::string log_level;                          // overrides the logger config when set
    std::vector<std::size_t> concurrency_levels;   // overrides the config when non-empty
};

static std::optional<Cli> parse_cli(int argc, char** argv) {
    Cli cli{};
    for (int idx = 1; idx < argc; ++idx) {
        const std::string arg = argv[idx];
        if (arg == "--config" || arg == "--log-config" || arg == "--log-level") {
            if (idx + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            const std::string value = argv[++idx];
            if (arg == "--config") {
                cli.config_path = value;
            } else if (arg == "--log-config") {
                cli.logger_path = value;
            } else {
                cli.log_level = value;
            }
            continue;
        }
        const auto level = bench_rb::ParseCount(arg);
        if (!level) {
            std::cerr << "Invalid concurrency level: " << arg << std::endl;
            return std::nullopt;
        }
        cli.concurrency_levels.push_back(*level);
    }
    return cli;
}

int main(int argc, char** argv) {
    auto cli = parse_cli(argc, argv);
    if (!cli) {
        std::cerr << "Usage: " << argv[0]
                  << " [--config path] [--log-config path] [--log-level level] [concurrency...]" << std::endl;
        return 2;
    }

    rerank_bench::log::InitializeLogger(cli->logger_path);
    if (!cli->log_level.empty()) {
        rerank_bench::log::SetLevel(cli->log_level);
    }

    rerank_bench::BenchmarkConfig cfg;
    if (auto loaded = rerank_bench::BenchConfigLoader::FromFile(cli->config_path)) {
        cfg = loaded->GetConfig();
    } else {
        RB_LOG_WARN("cannot load benchmark config {}, using defaults", cli->config_path);
    }
    if (!cli->concurrency_levels.empty()) {
        cfg.concurrency_levels = cli->concurrency_levels;
    }

    try {
        rerank_bench::ClientPool pool;
        bench_rb::RerankBenchmark bench(cfg, pool);
        bench.RunAll(std::cout);
        pool.ReleaseAll();
    } catch (const std::exception& e) {
        RB_LOG_ERROR("benchmark aborted: {}", e.what());
        return 1;
    }
    return 0;
}
