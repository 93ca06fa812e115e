#include "crimrag/retrieval/reranker.hpp"
#include "crimrag/error.hpp"
#include "crimrag/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace crimrag {
namespace retrieval {

RerankOutcome PassThroughReranker::rerank(const std::string&,
                                          const std::vector<RetrievedDocument>& documents) const {
    return RerankOutcome{documents, false, std::nullopt};
}

ScoringReranker::ScoringReranker(std::shared_ptr<ScoringClient> scorer, std::size_t top_n)
    : scorer_(std::move(scorer)),
      top_n_(top_n) {
    CRIMRAG_CHECK_ARGUMENT(scorer_ != nullptr, "ScoringReranker needs a scoring client");
}

RerankOutcome ScoringReranker::rerank(const std::string& query,
                                      const std::vector<RetrievedDocument>& documents) const {
    if (documents.empty()) {
        return RerankOutcome{documents, false, std::nullopt};
    }

    std::vector<std::string> passages;
    passages.reserve(documents.size());
    for (const auto& doc : documents) {
        passages.push_back(doc.chunk ? doc.chunk->text : std::string());
    }

    std::vector<float> scores;
    try {
        scores = scorer_->score_batch(query, passages);
    } catch (const std::exception& e) {
        LOG_WARNING("Reranking failed, keeping retrieval order: " + std::string(e.what()));
        return RerankOutcome{documents, false, std::string(e.what())};
    }

    if (scores.size() != documents.size()) {
        const std::string failure = "scorer returned " + std::to_string(scores.size()) + " scores for " +
                                    std::to_string(documents.size()) + " documents";
        LOG_WARNING("Reranking failed, keeping retrieval order: " + failure);
        return RerankOutcome{documents, false, failure};
    }
    if (std::any_of(scores.begin(), scores.end(), [](float s) { return std::isnan(s); })) {
        LOG_WARNING("Reranking failed, keeping retrieval order: scorer returned NaN");
        return RerankOutcome{documents, false, std::string("scorer returned NaN")};
    }

    std::vector<std::size_t> order(documents.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&scores](std::size_t a, std::size_t b) { return scores[a] > scores[b]; });

    const std::size_t keep = top_n_ > 0 ? std::min(top_n_, order.size()) : order.size();

    RerankOutcome outcome;
    outcome.applied = true;
    outcome.documents.reserve(keep);
    for (std::size_t i = 0; i < keep; ++i) {
        RetrievedDocument doc = documents[order[i]];
        doc.rerank_score = scores[order[i]];
        doc.rank = i + 1;
        outcome.documents.push_back(std::move(doc));
    }

    LOG_DEBUG("Reranked " + std::to_string(documents.size()) + " documents, kept " + std::to_string(keep));
    return outcome;
}

std::shared_ptr<const Reranker> make_reranker(bool enabled,
                                              std::shared_ptr<ScoringClient> scorer,
                                              std::size_t top_n) {
    if (!enabled) {
        return std::make_shared<PassThroughReranker>();
    }
    if (!scorer) {
        LOG_WARNING("Reranking requested but no scoring client is configured; using pass-through");
        return std::make_shared<PassThroughReranker>();
    }
    return std::make_shared<ScoringReranker>(std::move(scorer), top_n);
}

} // namespace retrieval
} // namespace crimrag
