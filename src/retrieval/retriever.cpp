#include "crimrag/retrieval/retriever.hpp"
#include "crimrag/error.hpp"
#include "crimrag/logging.hpp"
#include "crimrag/util/vector_ops.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace crimrag {
namespace retrieval {

std::vector<std::size_t> mmr_select(const std::vector<index::IndexCandidate>& pool,
                                    std::size_t k,
                                    double lambda) {
    std::vector<std::size_t> selected;
    if (pool.empty() || k == 0) {
        return selected;
    }

    const std::size_t n = pool.size();
    std::vector<bool> taken(n, false);
    // Highest cosine similarity between each candidate and the selected set.
    std::vector<double> redundancy(n, 0.0);

    while (selected.size() < k && selected.size() < n) {
        std::size_t best = n;
        double best_score = -std::numeric_limits<double>::infinity();

        for (std::size_t i = 0; i < n; ++i) {
            if (taken[i]) {
                continue;
            }
            const double mmr = lambda * pool[i].score - (1.0 - lambda) * redundancy[i];
            if (mmr > best_score) {
                best_score = mmr;
                best = i;
            }
        }

        taken[best] = true;
        selected.push_back(best);

        for (std::size_t i = 0; i < n; ++i) {
            if (!taken[i]) {
                const double sim = util::cosine_similarity(pool[i].embedding, pool[best].embedding);
                redundancy[i] = selected.size() == 1 ? sim : std::max(redundancy[i], sim);
            }
        }
    }

    return selected;
}

Retriever::Retriever(std::shared_ptr<index::IndexAdapter> index, RetrievalConfig config)
    : index_(std::move(index)),
      config_(config) {
    CRIMRAG_CHECK_ARGUMENT(index_ != nullptr, "Retriever needs an index adapter");
    CRIMRAG_CHECK_ARGUMENT(config_.min_k > 0 && config_.min_k <= config_.max_k,
                           "retrieval.min_k must be positive and not above max_k");
    CRIMRAG_CHECK_ARGUMENT(config_.oversample_factor > 0, "retrieval.oversample_factor must be positive");
}

std::size_t Retriever::clamp_k(std::optional<std::size_t> k) const {
    const std::size_t requested = k.value_or(config_.default_k);
    return std::clamp(requested, config_.min_k, config_.max_k);
}

double Retriever::clamp_lambda(std::optional<double> lambda) const {
    double value = lambda.value_or(config_.diversity_lambda);
    if (std::isnan(value)) {
        value = config_.diversity_lambda;
    }
    return std::clamp(value, 0.0, 1.0);
}

std::vector<index::IndexCandidate> Retriever::fetch_pool(const std::string& query,
                                                         std::size_t pool_size,
                                                         const MetadataFilter& filter,
                                                         std::chrono::milliseconds timeout) const {
    // One deadline covers both index calls.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    try {
        const Embedding embedding = index_->embed(query, timeout);
        const auto remaining =
            std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw IndexUnavailableError("index query timed out after " + std::to_string(timeout.count()) + " ms",
                                        "Retriever::retrieve");
        }
        return index_->similarity_search(embedding, pool_size, filter, remaining);
    } catch (const CrimragException&) {
        throw;
    } catch (const std::exception& e) {
        throw IndexUnavailableError(std::string("index query failed: ") + e.what(), "Retriever::retrieve");
    }
}

std::vector<RetrievedDocument> Retriever::retrieve(const std::string& query,
                                                   std::optional<std::size_t> k,
                                                   const MetadataFilter& filter,
                                                   std::optional<double> diversity_lambda,
                                                   std::chrono::milliseconds timeout) const {
    CRIMRAG_CHECK_ARGUMENT(query.find_first_not_of(" \t\r\n") != std::string::npos, "query must not be empty");

    const std::size_t kk = clamp_k(k);
    const double lambda = clamp_lambda(diversity_lambda);
    const std::size_t pool_size = std::max(kk * config_.oversample_factor, kk);

    std::vector<index::IndexCandidate> candidates = fetch_pool(query, pool_size, filter, timeout);
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const index::IndexCandidate& a, const index::IndexCandidate& b) {
                         return a.score > b.score;
                     });

    std::vector<index::IndexCandidate> pool;
    pool.reserve(candidates.size());
    std::unordered_set<std::string> seen;
    std::size_t dropped = 0;
    for (auto& candidate : candidates) {
        if (!candidate.chunk || !seen.insert(candidate.chunk->id).second) {
            ++dropped;
            continue;
        }
        if (!filter.matches(candidate.metadata)) {
            ++dropped;
            continue;
        }
        pool.push_back(std::move(candidate));
    }
    if (dropped > 0) {
        LOG_DEBUG("Dropped " + std::to_string(dropped) + " duplicate or non-matching candidates");
    }

    if (pool.empty()) {
        LOG_INFO("No candidates for query (filters: " + (filter.empty() ? std::string("none") : filter.describe()) + ")");
        return {};
    }

    std::vector<std::size_t> selected = mmr_select(pool, kk, lambda);
    // Pool is in descending-score order, so position order is rank order.
    std::sort(selected.begin(), selected.end());

    std::vector<RetrievedDocument> documents;
    documents.reserve(selected.size());
    for (std::size_t i = 0; i < selected.size(); ++i) {
        index::IndexCandidate& candidate = pool[selected[i]];
        RetrievedDocument doc;
        doc.chunk = std::move(candidate.chunk);
        doc.metadata = std::move(candidate.metadata);
        doc.similarity_score = candidate.score;
        doc.rank = i + 1;
        doc.collection_name = std::move(candidate.collection_name);
        documents.push_back(std::move(doc));
    }

    LOG_INFO("Retrieved " + std::to_string(documents.size()) + " documents (k=" + std::to_string(kk) +
             ", pool=" + std::to_string(pool.size()) + ", lambda=" + std::to_string(lambda) + ")");
    return documents;
}

} // namespace retrieval
} // namespace crimrag
