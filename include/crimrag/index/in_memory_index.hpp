#pragma once

#include "crimrag/index/index_adapter.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace crimrag {
namespace index {

/**
 * Brute-force cosine index held in process memory.
 *
 * Searches take a shared lock, upserts an exclusive one. Equal scores are
 * ordered by insertion position, so results are deterministic for a fixed
 * set of entries.
 */
class InMemoryIndex : public IndexAdapter {
public:
    explicit InMemoryIndex(std::shared_ptr<TextEmbedder> embedder,
                           std::string collection_name = "memory");

    Embedding embed(const std::string& text, std::chrono::milliseconds timeout) override;

    std::vector<IndexCandidate> similarity_search(const Embedding& embedding,
                                                  std::size_t k,
                                                  const MetadataFilter& filter,
                                                  std::chrono::milliseconds timeout) override;

    void upsert(const std::vector<IndexedChunk>& chunks, std::chrono::milliseconds timeout) override;

    // Stores a chunk with a precomputed embedding.
    void upsert(Chunk chunk, DocumentMetadata metadata, Embedding embedding);

    bool is_healthy() override { return true; }

    std::size_t size() const;
    const std::string& collection_name() const { return collection_name_; }

private:
    struct Entry {
        std::shared_ptr<const Chunk> chunk;
        DocumentMetadata metadata;
        Embedding embedding;
    };

    void store_locked(Entry entry);

    std::shared_ptr<TextEmbedder> embedder_;
    std::string collection_name_;

    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> positions_;
};

} // namespace index
} // namespace crimrag
