#include "rerank_bench/config.hpp"
#include "rerank_bench/logger.hpp"

#include <cmath>
#include <fstream>

namespace rerank_bench {

namespace {

// Counts must be JSON non-negative integers; -1 or 2.5 are rejected, not converted.
bool ReadCount(const nlohmann::json& b, const char* key, std::size_t& out) {
    if (!b.contains(key)) {
        return true;
    }
    const auto& v = b.at(key);
    if (!v.is_number_unsigned()) {
        RB_LOG_ERROR("config: benchmark.{} must be a non-negative integer, got {}", key, v.dump());
        return false;
    }
    out = v.get<std::size_t>();
    return true;
}

}

ClientConfig::ClientConfig()
    : ClientConfig(kDefaultEndpoint) {}

ClientConfig::ClientConfig(std::string endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
    if (endpoint_.empty()) {
        endpoint_ = kDefaultEndpoint;
    }
}

std::optional<BenchConfigLoader> BenchConfigLoader::FromString(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        RB_LOG_ERROR("config: parse error: {}", e.what());
        return std::nullopt;
    }
    return FromJson(j);
}

std::optional<BenchConfigLoader> BenchConfigLoader::FromJson(const nlohmann::json& j) {
    BenchConfigLoader loader;
    if (!loader.Parse(j)) {
        return std::nullopt;
    }
    return loader;
}

std::optional<BenchConfigLoader> BenchConfigLoader::FromFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        RB_LOG_ERROR("config: cannot open {}", path);
        return std::nullopt;
    }
    nlohmann::json j;
    try {
        ifs >> j;
    } catch (const nlohmann::json::exception& e) {
        RB_LOG_ERROR("config: parse error in {}: {}", path, e.what());
        return std::nullopt;
    }
    return FromJson(j);
}

bool BenchConfigLoader::Parse(const nlohmann::json& j) {
    if (!j.is_object()) {
        RB_LOG_ERROR("config: root must be an object");
        return false;
    }
    BenchmarkConfig cfg;
    try {
        if (j.contains("client")) {
            const auto& c = j.at("client");
            std::string base_url = c.value("base_url", std::string(ClientConfig::kDefaultEndpoint));
            auto timeout = ClientConfig::kDefaultTimeout;
            if (c.contains("timeout_s")) {
                const double secs = c.at("timeout_s").get<double>();
                if (!(secs > 0.0)) {
                    RB_LOG_ERROR("config: client.timeout_s must be positive, got {}", secs);
                    return false;
                }
                timeout = std::chrono::milliseconds(std::llround(secs * 1000.0));
            }
            cfg.client = ClientConfig(std::move(base_url), timeout);
        }
        if (j.contains("benchmark")) {
            const auto& b = j.at("benchmark");
            if (b.contains("concurrency_levels")) {
                const auto& levels = b.at("concurrency_levels");
                if (!levels.is_array()) {
                    RB_LOG_ERROR("config: benchmark.concurrency_levels must be a list");
                    return false;
                }
                cfg.concurrency_levels.clear();
                for (const auto& level : levels) {
                    if (!level.is_number_unsigned() || level.get<std::size_t>() == 0) {
                        RB_LOG_ERROR("config: concurrency levels must be positive integers, got {}",
                                     level.dump());
                        return false;
                    }
                    cfg.concurrency_levels.push_back(level.get<std::size_t>());
                }
            }
            if (!ReadCount(b, "requests_per_user", cfg.requests_per_user) ||
                !ReadCount(b, "n_docs", cfg.n_docs) ||
                !ReadCount(b, "top_n", cfg.top_n) ||
                !ReadCount(b, "warmup", cfg.warmup)) {
                return false;
            }
            if (b.contains("model")) cfg.model = b.at("model").get<std::string>();
            if (b.contains("query")) cfg.query = b.at("query").get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        RB_LOG_ERROR("config: invalid value: {}", e.what());
        return false;
    }
    cfg_ = std::move(cfg);
    ready_ = true;
    return true;
}

std::string BenchConfigLoader::Dump(int indent) const {
    nlohmann::json j;
    j["client"] = {
        {"base_url", cfg_.client.Endpoint()},
        {"timeout_s", static_cast<double>(cfg_.client.Timeout().count()) / 1000.0},
    };
    j["benchmark"] = {
        {"concurrency_levels", cfg_.concurrency_levels},
        {"requests_per_user", cfg_.requests_per_user},
        {"n_docs", cfg_.n_docs},
        {"top_n", cfg_.top_n},
        {"warmup", cfg_.warmup},
        {"model", cfg_.model},
        {"query", cfg_.query},
    };
    return j.dump(indent);
}

}
