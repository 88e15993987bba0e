#include "rerank_bench/scoring_client.hpp"
#include "rerank_bench/client_handle.hpp"
#include "rerank_bench/errors.hpp"

#include <fmt/format.h>

namespace rerank_bench {

namespace {

constexpr std::size_t kErrorBodyMax = 500;

nlohmann::json PostJson(ClientHandle& client,
                        const std::string& path,
                        const nlohmann::json& payload,
                        std::optional<std::chrono::milliseconds> timeout) {
    const auto url = client.Config().Endpoint() + path;
    const auto resp = client.Post(path, payload.dump(), timeout.value_or(client.Config().Timeout()));

    if (resp.status >= 400) {
        throw HttpStatusError(resp.status, resp.body,
                              fmt::format("HTTP {} for {}: {}", resp.status, url, resp.body));
    }
    nlohmann::json raw;
    try {
        raw = nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(fmt::format("Failed to parse JSON from {}: {}; text={}",
                                        url, e.what(), resp.body.substr(0, kErrorBodyMax)));
    }
    if (!raw.is_object()) {
        throw ProtocolError(fmt::format("Unexpected response from {}: {}",
                                        url, resp.body.substr(0, kErrorBodyMax)));
    }
    return raw;
}

}

RerankResult Rerank(ClientHandle& client, const RerankRequest& req) {
    RerankResult out;
    if (req.documents.empty()) {
        out.raw = {{"results", nlohmann::json::array()}, {"usage", {{"total_tokens", 0}}}};
        return out;
    }

    nlohmann::json payload = {{"query", req.query}, {"documents", req.documents}};
    if (req.top_n) {
        payload["top_n"] = *req.top_n;
    }
    if (!req.model.empty()) {
        payload["model"] = req.model;
    }

    out.raw = PostJson(client, "/rerank", payload, req.timeout);
    const auto results = out.raw.value("results", nlohmann::json::array());
    if (!results.is_array()) {
        throw ProtocolError(fmt::format("Unexpected /rerank response (results not list): {}", out.raw.dump()));
    }

    out.scores_aligned.assign(req.documents.size(), std::nullopt);
    try {
        for (const auto& r : results) {
            const auto idx = r.at("index").get<long long>();
            if (idx < 0 || static_cast<std::size_t>(idx) >= req.documents.size()) {
                throw ProtocolError(fmt::format("/rerank returned index {} for {} documents",
                                                idx, req.documents.size()));
            }

            RankedItem item;
            item.index = static_cast<std::size_t>(idx);
            item.score = r.value("relevance_score", 0.0);
            if (r.contains("document") && r["document"].is_object()
                && r["document"].value("text", std::string()).size() > 0) {
                item.doc = r["document"]["text"].get<std::string>();
            } else {
                item.doc = req.documents[item.index];
            }
            out.scores_aligned[item.index] = item.score;
            out.ranked.push_back(std::move(item));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(fmt::format("Malformed /rerank result: {}", e.what()));
    }
    return out;
}

ScoreResult Score(ClientHandle& client, const ScoreRequest& req) {
    ScoreResult out;
    if (req.documents.empty()) {
        out.raw = {{"data", nlohmann::json::array()}, {"usage", {{"total_tokens", 0}}}};
        return out;
    }

    nlohmann::json payload = {{"text_1", req.query}, {"text_2", req.documents}};
    if (!req.model.empty()) {
        payload["model"] = req.model;
    }

    out.raw = PostJson(client, "/score", payload, req.timeout);
    const auto data = out.raw.value("data", nlohmann::json::array());
    if (!data.is_array()) {
        throw ProtocolError(fmt::format("Unexpected /score response (data not list): {}", out.raw.dump()));
    }

    std::vector<std::optional<double>> aligned(req.documents.size());
    try {
        for (const auto& x : data) {
            const auto idx = x.at("index").get<long long>();
            const auto sc = x.at("score").get<double>();
            if (idx >= 0 && static_cast<std::size_t>(idx) < aligned.size()) {
                aligned[static_cast<std::size_t>(idx)] = sc;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(fmt::format("Malformed /score result: {}", e.what()));
    }

    out.scores.reserve(aligned.size());
    out.items.reserve(aligned.size());
    for (std::size_t i = 0; i < aligned.size(); ++i) {
        if (!aligned[i]) {
            throw ProtocolError(fmt::format("Incomplete scores returned by /score: {}", out.raw.dump()));
        }
        out.scores.push_back(*aligned[i]);
        out.items.push_back(RankedItem{i, *aligned[i], req.documents[i]});
    }
    return out;
}

}
