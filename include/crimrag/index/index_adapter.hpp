#pragma once

#include "crimrag/filter.hpp"
#include "crimrag/types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace crimrag {
namespace index {

// One similarity-search hit, before diversification.
struct IndexCandidate {
    std::shared_ptr<const Chunk> chunk;
    DocumentMetadata metadata;
    float score = 0.0f;
    Embedding embedding;            // may be empty if the backend did not return it
    std::string collection_name;
};

struct IndexedChunk {
    Chunk chunk;
    DocumentMetadata metadata;
};

class TextEmbedder {
public:
    virtual ~TextEmbedder() = default;

    // Throws IndexUnavailableError when the embedding backend fails.
    virtual Embedding embed(const std::string& text, std::chrono::milliseconds timeout) = 0;
    virtual std::size_t dimension() const = 0;
};

/**
 * Contract over an embedding + similarity-search backend. Implementations
 * throw IndexUnavailableError when the backend cannot be reached or times
 * out, and must return candidates in a deterministic order for a fixed
 * index snapshot.
 */
class IndexAdapter {
public:
    virtual ~IndexAdapter() = default;

    virtual Embedding embed(const std::string& text, std::chrono::milliseconds timeout) = 0;

    // Up to `k` candidates passing `filter`, by descending score.
    virtual std::vector<IndexCandidate> similarity_search(const Embedding& embedding,
                                                          std::size_t k,
                                                          const MetadataFilter& filter,
                                                          std::chrono::milliseconds timeout) = 0;

    // Insert or replace by chunk id.
    virtual void upsert(const std::vector<IndexedChunk>& chunks, std::chrono::milliseconds timeout) = 0;

    virtual bool is_healthy() = 0;
};

} // namespace index
} // namespace crimrag
