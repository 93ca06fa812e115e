#include "crimrag/retrieval/scoring_client.hpp"
#include "crimrag/error.hpp"
#include "crimrag/logging.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cmath>

namespace crimrag {
namespace retrieval {

std::vector<float> ScoringClient::score_batch(const std::string& query, const std::vector<std::string>& passages) {
    std::vector<float> scores;
    scores.reserve(passages.size());
    for (const auto& passage : passages) {
        scores.push_back(score(query, passage));
    }
    return scores;
}

HttpScoringClient::HttpScoringClient(std::shared_ptr<net::HttpClient> http_client, RerankerConfig config)
    : http_client_(std::move(http_client)),
      config_(std::move(config)) {
    CRIMRAG_CHECK_ARGUMENT(http_client_ != nullptr, "HttpScoringClient needs an HTTP client");
}

float HttpScoringClient::score(const std::string& query, const std::string& passage) {
    return score_batch(query, {passage}).front();
}

std::vector<float> HttpScoringClient::score_batch(const std::string& query, const std::vector<std::string>& passages) {
    if (passages.empty()) {
        return {};
    }

    LOG_DEBUG("Scoring " + std::to_string(passages.size()) + " passages");

    net::HttpHeaders headers;
    if (!config_.service.api_key.empty()) {
        headers["Authorization"] = "Bearer " + config_.service.api_key;
    }

    net::HttpResponse response;
    try {
        response = http_client_->send_request("POST", net::join_url(config_.service.url, "rerank"),
                                              build_rerank_request(query, passages), headers,
                                              std::chrono::milliseconds(config_.service.timeout_ms));
    } catch (const net::HttpTransportError& e) {
        throw ScoringError(std::string("scoring service unreachable: ") + e.what(), "HttpScoringClient::score_batch");
    }

    if (!response.ok()) {
        throw ScoringError("scoring service returned HTTP " + std::to_string(response.status),
                           "HttpScoringClient::score_batch");
    }
    return parse_rerank_response(response.body, passages.size());
}

std::string HttpScoringClient::build_rerank_request(const std::string& query,
                                                    const std::vector<std::string>& passages) const {
    boost::json::object root;
    root["query"] = query;

    boost::json::array documents;
    for (const auto& passage : passages) {
        documents.push_back(boost::json::string(passage));
    }
    root["documents"] = std::move(documents);
    root["model"] = config_.model;
    root["return_documents"] = false;

    return boost::json::serialize(root);
}

std::vector<float> HttpScoringClient::parse_rerank_response(const std::string& response, std::size_t expected) {
    std::vector<float> scores(expected, std::nanf(""));
    try {
        const boost::json::value val = boost::json::parse(response);
        const auto& results = val.as_object().at("results").as_array();
        for (const auto& item : results) {
            const auto& result = item.as_object();
            const auto index = result.at("index").to_number<int64_t>();
            if (index < 0 || static_cast<std::size_t>(index) >= expected) {
                throw std::runtime_error("result index " + std::to_string(index) + " out of range");
            }
            scores[static_cast<std::size_t>(index)] =
                static_cast<float>(result.at("relevance_score").to_number<double>());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to parse rerank response: " + std::string(e.what()));
        throw ScoringError(std::string("invalid rerank response: ") + e.what(),
                           "HttpScoringClient::parse_rerank_response");
    }

    for (float value : scores) {
        if (std::isnan(value)) {
            throw ScoringError("rerank response is missing scores", "HttpScoringClient::parse_rerank_response");
        }
    }
    return scores;
}

} // namespace retrieval
} // namespace crimrag
