#pragma once

#include "crimrag/config.hpp"
#include "crimrag/filter.hpp"
#include "crimrag/index/index_adapter.hpp"
#include "crimrag/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace crimrag {
namespace retrieval {

/**
 * Maximal Marginal Relevance selection over a pool ordered by descending
 * similarity. Returns pool positions in selection order.
 *
 * Each step picks the candidate maximizing
 *   lambda * score - (1 - lambda) * max cosine(candidate, already selected)
 * and the lower pool position wins ties.
 */
std::vector<std::size_t> mmr_select(const std::vector<index::IndexCandidate>& pool,
                                    std::size_t k,
                                    double lambda);

/**
 * Diversified, metadata-filtered similarity retrieval. Immutable after
 * construction; safe to call concurrently.
 */
class Retriever {
public:
    Retriever(std::shared_ptr<index::IndexAdapter> index, RetrievalConfig config);

    // Throws IndexUnavailableError; an empty vector means nothing matched.
    std::vector<RetrievedDocument> retrieve(const std::string& query,
                                            std::optional<std::size_t> k,
                                            const MetadataFilter& filter,
                                            std::optional<double> diversity_lambda,
                                            std::chrono::milliseconds timeout) const;

    std::size_t clamp_k(std::optional<std::size_t> k) const;
    double clamp_lambda(std::optional<double> lambda) const;

    const RetrievalConfig& config() const { return config_; }

private:
    std::vector<index::IndexCandidate> fetch_pool(const std::string& query,
                                                  std::size_t pool_size,
                                                  const MetadataFilter& filter,
                                                  std::chrono::milliseconds timeout) const;

    std::shared_ptr<index::IndexAdapter> index_;
    RetrievalConfig config_;
};

} // namespace retrieval
} // namespace crimrag
