#pragma once

#include "rerank_bench/fwd.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rerank_bench {

// One document's score, `index` pointing into the request's documents.
struct RankedItem {
    std::size_t index = 0;
    double      score = 0.0;
    std::string doc;
};

struct RerankRequest {
    std::string query;
    std::vector<std::string> documents;
    std::optional<std::size_t> top_n;
    std::string model;                                   // empty: server default
    std::optional<std::chrono::milliseconds> timeout;    // empty: handle config
};

struct RerankResult {
    std::vector<RankedItem> ranked;                      // server order, best first
    std::vector<std::optional<double>> scores_aligned;   // per input doc, empty if not returned
    nlohmann::json raw;
};

struct ScoreRequest {
    std::string query;
    std::vector<std::string> documents;
    std::string model;
    std::optional<std::chrono::milliseconds> timeout;
};

struct ScoreResult {
    std::vector<RankedItem> items;                       // input order
    std::vector<double> scores;                          // aligned to input docs
    nlohmann::json raw;
};

// POST {endpoint}/rerank. An empty document list returns an empty result without
// contacting the server. Throws TransportError, HttpStatusError or ProtocolError.
RerankResult Rerank(ClientHandle& client, const RerankRequest& req);

// POST {endpoint}/score. Every input document must come back with a score,
// otherwise ProtocolError.
ScoreResult Score(ClientHandle& client, const ScoreRequest& req);

}
