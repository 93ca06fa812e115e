#pragma once

#include "crimrag/retrieval/scoring_client.hpp"
#include "crimrag/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace crimrag {
namespace retrieval {

struct RerankOutcome {
    std::vector<RetrievedDocument> documents;
    bool applied = false;
    std::optional<std::string> failure;
};

/**
 * Second-pass relevance ordering over the retriever's output. Never throws:
 * failures come back in RerankOutcome::failure with the input untouched.
 */
class Reranker {
public:
    virtual ~Reranker() = default;

    virtual RerankOutcome rerank(const std::string& query,
                                 const std::vector<RetrievedDocument>& documents) const = 0;
    virtual const char* name() const = 0;
};

class PassThroughReranker : public Reranker {
public:
    RerankOutcome rerank(const std::string& query,
                         const std::vector<RetrievedDocument>& documents) const override;
    const char* name() const override { return "pass_through"; }
};

/**
 * Orders documents by descending ScoringClient score (stable, so equal
 * scores keep retrieval order), stores rerank_score and renumbers rank.
 * A non-zero top_n keeps only the first top_n documents.
 */
class ScoringReranker : public Reranker {
public:
    explicit ScoringReranker(std::shared_ptr<ScoringClient> scorer, std::size_t top_n = 0);

    RerankOutcome rerank(const std::string& query,
                         const std::vector<RetrievedDocument>& documents) const override;
    const char* name() const override { return "scoring"; }

private:
    std::shared_ptr<ScoringClient> scorer_;
    std::size_t top_n_;
};

// Scoring reranker when enabled and a scorer exists, pass-through otherwise.
std::shared_ptr<const Reranker> make_reranker(bool enabled,
                                              std::shared_ptr<ScoringClient> scorer,
                                              std::size_t top_n = 0);

} // namespace retrieval
} // namespace crimrag
