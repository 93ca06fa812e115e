#pragma once

#include "crimrag/config.hpp"
#include "crimrag/filter.hpp"
#include "crimrag/generation/generation_client.hpp"
#include "crimrag/index/index_adapter.hpp"
#include "crimrag/pipeline/audit_log.hpp"
#include "crimrag/pipeline/citation_formatter.hpp"
#include "crimrag/pipeline/pipeline_state.hpp"
#include "crimrag/retrieval/reranker.hpp"
#include "crimrag/retrieval/retriever.hpp"
#include "crimrag/retrieval/scoring_client.hpp"

#include <boost/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace crimrag {
namespace pipeline {

class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    bool is_cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct QueryOptions {
    std::optional<std::size_t> k;
    std::optional<bool> use_reranker;
    MetadataFilter filters;
    std::optional<double> diversity_lambda;
    std::optional<std::size_t> max_context_tokens;
    std::optional<std::chrono::milliseconds> timeout;
    std::shared_ptr<const CancellationToken> cancel;
};

struct QueryResult {
    std::optional<std::string> response;
    std::vector<Citation> sources;
    std::optional<PipelineError> error;
    boost::json::object metadata;

    bool ok() const { return !error.has_value(); }
};

// Shared, long-lived collaborators. Built once at startup.
struct PipelineContext {
    Config config;
    std::shared_ptr<index::IndexAdapter> index;
    std::shared_ptr<generation::GenerationClient> generator;
    std::shared_ptr<retrieval::ScoringClient> scorer;   // optional
    std::shared_ptr<AuditSink> audit;                   // optional
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * Retrieve -> (Rerank) -> Generate -> Format, one PipelineState per query.
 *
 * Component exceptions never escape run(): they end the state in FAILED
 * with a PipelineError. A reranking failure is recorded in metadata and
 * the pipeline continues with the retrieval order. Generation is retried
 * with exponential backoff. The Pipeline is immutable after construction
 * and safe to share between threads.
 */
class Pipeline {
public:
    // `sleeper` waits between generation retries; defaults to sleep_for.
    explicit Pipeline(std::shared_ptr<const PipelineContext> context, Sleeper sleeper = {});

    QueryResult run(const std::string& query, const QueryOptions& options = {}) const;

    // Full state of one invocation. Throws InputError for a rejected query.
    PipelineState execute(const std::string& query, const QueryOptions& options = {}) const;

    // Runs queries concurrently (at most pipeline.max_concurrent_queries at
    // a time). Results are in input order.
    std::vector<QueryResult> run_batch(const std::vector<std::string>& queries,
                                       const QueryOptions& options = {}) const;

    // Throws InputError.
    void validate(const std::string& query, const QueryOptions& options) const;

    // Delay before retry number `attempt` (0-based).
    std::chrono::milliseconds backoff_delay(uint32_t attempt) const;

    const PipelineContext& context() const { return *context_; }

private:
    bool check_cancelled(PipelineState& state, const QueryOptions& options, const char* stage) const;

    bool retrieve_stage(PipelineState& state, const QueryOptions& options) const;
    bool rerank_stage(PipelineState& state, const QueryOptions& options) const;
    bool generate_stage(PipelineState& state, const QueryOptions& options) const;
    bool format_stage(PipelineState& state, const QueryOptions& options) const;

    std::string generate_with_retry(PipelineState& state, const std::string& prompt,
                                    const QueryOptions& options) const;

    std::chrono::milliseconds index_timeout(const QueryOptions& options) const;
    std::chrono::milliseconds generation_timeout(const QueryOptions& options) const;

    void write_audit(const PipelineState& state) const;

    std::shared_ptr<const PipelineContext> context_;
    retrieval::Retriever retriever_;
    std::shared_ptr<const retrieval::Reranker> pass_through_reranker_;
    std::shared_ptr<const retrieval::Reranker> scoring_reranker_;
    CitationFormatter formatter_;
    Sleeper sleeper_;
};

// Converts a finished state into the caller-facing result.
QueryResult to_query_result(const PipelineState& state);

} // namespace pipeline
} // namespace crimrag
