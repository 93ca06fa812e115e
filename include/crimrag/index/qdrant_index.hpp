#pragma once

#include "crimrag/config.hpp"
#include "crimrag/index/index_adapter.hpp"
#include "crimrag/net/http_client.hpp"

#include <boost/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace crimrag {
namespace index {

/**
 * Index adapter over the Qdrant REST API.
 *
 * Each chunk is one point whose id is a UUID derived from the chunk id, so
 * re-ingesting a document replaces its points. Metadata fields are stored
 * as flat string payload keys and filters become `must` match conditions.
 */
class QdrantIndex : public IndexAdapter {
public:
    QdrantIndex(std::shared_ptr<net::HttpClient> http_client,
                std::shared_ptr<TextEmbedder> embedder,
                IndexConfig config);

    Embedding embed(const std::string& text, std::chrono::milliseconds timeout) override;

    std::vector<IndexCandidate> similarity_search(const Embedding& embedding,
                                                  std::size_t k,
                                                  const MetadataFilter& filter,
                                                  std::chrono::milliseconds timeout) override;

    void upsert(const std::vector<IndexedChunk>& chunks, std::chrono::milliseconds timeout) override;

    bool is_healthy() override;

    // Creates the collection with cosine distance unless it already exists.
    void ensure_collection(std::size_t dimension, std::chrono::milliseconds timeout);

    static boost::json::object build_filter(const MetadataFilter& filter);
    static boost::json::object build_payload(const Chunk& chunk, const DocumentMetadata& metadata);
    static IndexCandidate parse_point(const boost::json::object& point, const std::string& collection);

private:
    net::HttpResponse call(const std::string& method, const std::string& path,
                           const boost::json::value* body, std::chrono::milliseconds timeout,
                           const char* operation);
    std::string collection_path(const std::string& suffix = "") const;

    std::shared_ptr<net::HttpClient> http_client_;
    std::shared_ptr<TextEmbedder> embedder_;
    IndexConfig config_;
};

} // namespace index
} // namespace crimrag
