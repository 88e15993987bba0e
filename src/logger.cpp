#include "rerank_bench/logger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>

namespace rerank_bench::log {

namespace {

constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

std::mutex& LoggerMutex() {
    static std::mutex m;
    return m;
}

LoggerPtr& LoggerSlot() {
    static LoggerPtr logger;
    return logger;
}

LoggerPtr MakeDefaultLogger() {
    auto logger = std::make_shared<spdlog::logger>(
        "rerank_bench", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_pattern(kDefaultPattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

}

void InitializeLogger(const std::string& config_path) {
    std::string level = "info";
    std::string pattern = kDefaultPattern;
    std::string file;

    std::ifstream ifs(config_path);
    if (ifs.is_open()) {
        try {
            nlohmann::json j;
            ifs >> j;
            level = j.value("level", level);
            pattern = j.value("pattern", pattern);
            file = j.value("file", file);
        } catch (const std::exception& e) {
            std::cerr << "Warning: failed to parse logger config " << config_path
                      << ": " << e.what() << ", using defaults" << std::endl;
        }
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Warning: cannot open log file " << file << ": " << e.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("rerank_bench", sinks.begin(), sinks.end());
    logger->set_pattern(pattern);
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);
    SetLogger(std::move(logger));
}

void SetLogger(LoggerPtr logger) {
    std::lock_guard<std::mutex> lk(LoggerMutex());
    LoggerSlot() = std::move(logger);
}

LoggerPtr LoadLogger() {
    std::lock_guard<std::mutex> lk(LoggerMutex());
    auto& slot = LoggerSlot();
    if (!slot) {
        slot = MakeDefaultLogger();
    }
    return slot;
}

void SetLevel(const std::string& level) {
    LoadLogger()->set_level(spdlog::level::from_str(level));
}

PerfScope::~PerfScope() noexcept {
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_);
    try {
        RB_LOG_DEBUG("[perf] {} took {}ns", name_, elapsed.count());
    } catch (const std::exception& e) {
        std::cerr << "perf scope " << name_ << ": " << e.what() << std::endl;
    }
}

}
