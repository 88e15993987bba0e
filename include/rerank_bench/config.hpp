#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rerank_bench {

// Connection settings for one scoring endpoint. Cache key of ClientPool.
// Defaults are applied and the endpoint normalized once, at construction.
class ClientConfig {
public:
    static constexpr const char* kDefaultEndpoint = "http://127.0.0.1:11438/v1";
    static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

    ClientConfig();
    explicit ClientConfig(std::string endpoint,
                          std::chrono::milliseconds timeout = kDefaultTimeout);

    const std::string& Endpoint() const noexcept { return endpoint_; }
    std::chrono::milliseconds Timeout() const noexcept { return timeout_; }

    bool operator==(const ClientConfig& other) const noexcept {
        return endpoint_ == other.endpoint_ && timeout_ == other.timeout_;
    }
    bool operator!=(const ClientConfig& other) const noexcept { return !(*this == other); }

private:
    std::string endpoint_;
    std::chrono::milliseconds timeout_;
};

struct BenchmarkConfig {
    ClientConfig client{};

    std::vector<std::size_t> concurrency_levels{50, 100, 150};
    std::size_t requests_per_user = 5;
    std::size_t n_docs = 16;
    std::size_t top_n = 10;          // 0 = let the server decide
    std::size_t warmup = 2;
    std::string model = "qwen3-reranker";
    std::string query = "What is the capital of China?";
};

class BenchConfigLoader {
public:
    static std::optional<BenchConfigLoader> FromString(const std::string& text);
    static std::optional<BenchConfigLoader> FromJson(const nlohmann::json& j);
    static std::optional<BenchConfigLoader> FromFile(const std::string& path);

    bool Ready() const noexcept { return ready_; }
    const BenchmarkConfig& GetConfig() const noexcept { return cfg_; }

    // Serialize the effective configuration back to JSON text.
    std::string Dump(int indent = 2) const;

private:
    BenchConfigLoader() = default;
    bool Parse(const nlohmann::json& j);

    BenchmarkConfig cfg_{};
    bool ready_ = false;
};

}
