#include "crimrag/index/embedding_client.hpp"
#include "crimrag/error.hpp"
#include "crimrag/logging.hpp"
#include "crimrag/util/vector_ops.hpp"

#include <boost/json.hpp>

#include <cctype>

namespace crimrag {
namespace index {

EmbeddingClient::EmbeddingClient(std::shared_ptr<net::HttpClient> http_client, EmbeddingConfig config)
    : http_client_(std::move(http_client)),
      config_(std::move(config)) {}

Embedding EmbeddingClient::embed(const std::string& text, std::chrono::milliseconds timeout) {
    auto embeddings = embed_batch({text}, timeout);
    return std::move(embeddings.front());
}

std::vector<Embedding> EmbeddingClient::embed_batch(const std::vector<std::string>& texts,
                                                    std::chrono::milliseconds timeout) {
    if (texts.empty()) {
        return {};
    }

    LOG_DEBUG("Generating embeddings for " + std::to_string(texts.size()) + " texts");

    net::HttpHeaders headers;
    if (!config_.service.api_key.empty()) {
        headers["Authorization"] = "Bearer " + config_.service.api_key;
    }

    net::HttpResponse response;
    try {
        response = http_client_->send_request("POST", net::join_url(config_.service.url, "embeddings"),
                                              build_embedding_request(texts), headers, timeout);
    } catch (const net::HttpTransportError& e) {
        throw IndexUnavailableError(std::string("embedding service unreachable: ") + e.what(),
                                    "EmbeddingClient::embed_batch");
    }

    if (!response.ok()) {
        throw IndexUnavailableError("embedding service returned HTTP " + std::to_string(response.status),
                                    "EmbeddingClient::embed_batch");
    }

    return parse_embedding_response(response.body, texts.size());
}

std::string EmbeddingClient::build_embedding_request(const std::vector<std::string>& texts) const {
    boost::json::object root;

    boost::json::array input_array;
    for (const auto& text : texts) {
        input_array.push_back(boost::json::string(text));
    }
    root["input"] = std::move(input_array);
    root["model"] = config_.model;
    root["encoding_format"] = "float";

    return boost::json::serialize(root);
}

std::vector<Embedding> EmbeddingClient::parse_embedding_response(const std::string& response,
                                                                 std::size_t expected) const {
    std::vector<Embedding> results(expected);
    try {
        const boost::json::value val = boost::json::parse(response);
        const auto& data = val.as_object().at("data").as_array();
        if (data.size() != expected) {
            throw std::runtime_error("expected " + std::to_string(expected) + " embeddings, got " +
                                     std::to_string(data.size()));
        }

        for (std::size_t i = 0; i < data.size(); ++i) {
            const auto& item = data[i].as_object();
            // OpenAI responses carry an explicit index; fall back to position
            std::size_t slot = i;
            if (const auto* index = item.if_contains("index")) {
                slot = static_cast<std::size_t>(index->to_number<int64_t>());
            }
            if (slot >= expected) {
                throw std::runtime_error("embedding index out of range");
            }

            Embedding embedding;
            const auto& values = item.at("embedding").as_array();
            embedding.reserve(values.size());
            for (const auto& value : values) {
                embedding.push_back(static_cast<float>(value.to_number<double>()));
            }
            results[slot] = std::move(embedding);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to parse embedding response: " + std::string(e.what()));
        throw IndexUnavailableError(std::string("invalid embedding response: ") + e.what(),
                                    "EmbeddingClient::parse_embedding_response");
    }

    for (const auto& embedding : results) {
        if (embedding.empty()) {
            throw IndexUnavailableError("embedding service returned an empty vector",
                                        "EmbeddingClient::parse_embedding_response");
        }
    }
    return results;
}

// HashingEmbedder

HashingEmbedder::HashingEmbedder(std::size_t dimension)
    : dimension_(dimension) {
    CRIMRAG_CHECK_ARGUMENT(dimension_ > 0, "embedding dimension must be positive");
}

Embedding HashingEmbedder::embed(const std::string& text, std::chrono::milliseconds) {
    return static_cast<const HashingEmbedder&>(*this).embed(text);
}

Embedding HashingEmbedder::embed(const std::string& text) const {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c) || c >= 0x80) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(std::move(current));
    }

    Embedding embedding(dimension_, 0.0f);
    auto add_feature = [&](const std::string& feature, float weight) {
        const uint64_t hash = util::fnv1a_64(feature);
        const std::size_t bucket = static_cast<std::size_t>(hash % dimension_);
        const float sign = (hash >> 63) ? -1.0f : 1.0f;
        embedding[bucket] += sign * weight;
    };

    for (std::size_t i = 0; i < words.size(); ++i) {
        add_feature(words[i], 1.0f);
        if (i + 1 < words.size()) {
            add_feature(words[i] + " " + words[i + 1], 0.5f);
        }
    }

    util::l2_normalize(embedding);
    return embedding;
}

} // namespace index
} // namespace crimrag
