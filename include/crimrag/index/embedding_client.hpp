#pragma once

#include "crimrag/config.hpp"
#include "crimrag/index/index_adapter.hpp"
#include "crimrag/net/http_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace crimrag {
namespace index {

/**
 * OpenAI-compatible /embeddings client.
 */
class EmbeddingClient : public TextEmbedder {
public:
    EmbeddingClient(std::shared_ptr<net::HttpClient> http_client, EmbeddingConfig config);

    Embedding embed(const std::string& text, std::chrono::milliseconds timeout) override;
    std::vector<Embedding> embed_batch(const std::vector<std::string>& texts,
                                       std::chrono::milliseconds timeout);

    std::size_t dimension() const override { return config_.dimension; }

private:
    std::string build_embedding_request(const std::vector<std::string>& texts) const;
    std::vector<Embedding> parse_embedding_response(const std::string& response, std::size_t expected) const;

    std::shared_ptr<net::HttpClient> http_client_;
    EmbeddingConfig config_;
};

/**
 * Local feature-hashing embedder: lowercased word unigrams and bigrams are
 * hashed into a fixed number of signed buckets, then L2-normalized. Fully
 * deterministic and offline.
 */
class HashingEmbedder : public TextEmbedder {
public:
    explicit HashingEmbedder(std::size_t dimension = 384);

    Embedding embed(const std::string& text, std::chrono::milliseconds timeout) override;
    Embedding embed(const std::string& text) const;

    std::size_t dimension() const override { return dimension_; }

private:
    std::size_t dimension_;
};

} // namespace index
} // namespace crimrag
