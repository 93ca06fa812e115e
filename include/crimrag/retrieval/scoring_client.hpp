#pragma once

#include "crimrag/config.hpp"
#include "crimrag/net/http_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace crimrag {
namespace retrieval {

/**
 * Query/passage relevance scorer (cross-encoder). Throws ScoringError.
 */
class ScoringClient {
public:
    virtual ~ScoringClient() = default;

    virtual float score(const std::string& query, const std::string& passage) = 0;

    // One score per passage, aligned with `passages`.
    virtual std::vector<float> score_batch(const std::string& query, const std::vector<std::string>& passages);
};

/**
 * Cross-encoder served behind a /rerank endpoint
 * (request {query, documents, model}, response {results: [{index, relevance_score}]}).
 */
class HttpScoringClient : public ScoringClient {
public:
    HttpScoringClient(std::shared_ptr<net::HttpClient> http_client, RerankerConfig config);

    float score(const std::string& query, const std::string& passage) override;
    std::vector<float> score_batch(const std::string& query, const std::vector<std::string>& passages) override;

private:
    std::string build_rerank_request(const std::string& query, const std::vector<std::string>& passages) const;
    static std::vector<float> parse_rerank_response(const std::string& response, std::size_t expected);

    std::shared_ptr<net::HttpClient> http_client_;
    RerankerConfig config_;
};

} // namespace retrieval
} // namespace crimrag
