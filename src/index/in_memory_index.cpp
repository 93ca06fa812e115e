#include "crimrag/index/in_memory_index.hpp"
#include "crimrag/error.hpp"
#include "crimrag/logging.hpp"
#include "crimrag/util/vector_ops.hpp"

#include <algorithm>
#include <mutex>

namespace crimrag {
namespace index {

InMemoryIndex::InMemoryIndex(std::shared_ptr<TextEmbedder> embedder, std::string collection_name)
    : embedder_(std::move(embedder)),
      collection_name_(std::move(collection_name)) {
    CRIMRAG_CHECK_ARGUMENT(embedder_ != nullptr, "InMemoryIndex needs an embedder");
}

Embedding InMemoryIndex::embed(const std::string& text, std::chrono::milliseconds timeout) {
    return embedder_->embed(text, timeout);
}

std::vector<IndexCandidate> InMemoryIndex::similarity_search(const Embedding& embedding,
                                                             std::size_t k,
                                                             const MetadataFilter& filter,
                                                             std::chrono::milliseconds) {
    struct Scored {
        std::size_t position;
        float score;
    };

    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Scored> scored;
    scored.reserve(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const Entry& entry = entries_[i];
        if (!filter.matches(entry.metadata)) {
            continue;
        }
        scored.push_back({i, util::cosine_similarity(embedding, entry.embedding)});
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const Scored& a, const Scored& b) { return a.score > b.score; });
    if (scored.size() > k) {
        scored.resize(k);
    }

    std::vector<IndexCandidate> candidates;
    candidates.reserve(scored.size());
    for (const auto& hit : scored) {
        const Entry& entry = entries_[hit.position];
        candidates.push_back({entry.chunk, entry.metadata, hit.score, entry.embedding, collection_name_});
    }
    return candidates;
}

void InMemoryIndex::upsert(const std::vector<IndexedChunk>& chunks, std::chrono::milliseconds timeout) {
    // Embed outside the lock; the embedder may be slow.
    std::vector<Entry> prepared;
    prepared.reserve(chunks.size());
    for (const auto& item : chunks) {
        prepared.push_back({std::make_shared<const Chunk>(item.chunk), item.metadata,
                            embedder_->embed(item.chunk.text, timeout)});
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& entry : prepared) {
        store_locked(std::move(entry));
    }
    LOG_DEBUG("InMemoryIndex now holds " + std::to_string(entries_.size()) + " chunks");
}

void InMemoryIndex::upsert(Chunk chunk, DocumentMetadata metadata, Embedding embedding) {
    Entry entry{std::make_shared<const Chunk>(std::move(chunk)), std::move(metadata), std::move(embedding)};
    std::unique_lock<std::shared_mutex> lock(mutex_);
    store_locked(std::move(entry));
}

std::size_t InMemoryIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

void InMemoryIndex::store_locked(Entry entry) {
    const std::string id = entry.chunk->id;
    auto it = positions_.find(id);
    if (it != positions_.end()) {
        entries_[it->second] = std::move(entry);
        return;
    }
    positions_.emplace(id, entries_.size());
    entries_.push_back(std::move(entry));
}

} // namespace index
} // namespace crimrag
