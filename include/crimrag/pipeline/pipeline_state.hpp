#pragma once

#include "crimrag/error.hpp"
#include "crimrag/types.hpp"

#include <boost/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace crimrag {
namespace pipeline {

enum class Stage {
    START,
    RETRIEVED,
    RERANKED,
    GENERATED,
    FORMATTED,
    DONE,
    FAILED
};

const char* stage_name(Stage stage) noexcept;

struct PipelineError {
    ErrorCode kind = ErrorCode::INTERNAL_ERROR;
    std::string message;
    std::optional<GenerationErrorKind> generation_kind;

    // The system was unavailable; the same query may succeed later.
    bool retryable() const noexcept {
        return kind == ErrorCode::INDEX_UNAVAILABLE || kind == ErrorCode::GENERATION_ERROR;
    }

    static PipelineError from_exception(const CrimragException& e);
};

/**
 * The record threaded through one pipeline invocation.
 *
 * Stage transitions only move forward. `response()` and `sources()` are
 * readable only once the state is DONE and `error()` only once it is
 * FAILED. After a failure, documents, reranked documents, context and
 * response are frozen; metadata may still grow.
 */
class PipelineState {
public:
    explicit PipelineState(std::string query);

    Stage stage() const { return stage_; }
    const std::string& query() const { return query_; }

    const std::vector<RetrievedDocument>& documents() const { return documents_; }
    const std::optional<std::vector<RetrievedDocument>>& reranked_documents() const { return reranked_documents_; }

    // Reranked documents when present, otherwise retrieved documents.
    const std::vector<RetrievedDocument>& active_documents() const;

    const std::optional<std::string>& context() const { return context_; }
    const std::vector<RetrievedDocument>& context_documents() const { return context_documents_; }
    const std::optional<std::string>& prompt() const { return prompt_; }

    std::optional<std::string> response() const;
    std::optional<std::vector<Citation>> sources() const;
    std::optional<PipelineError> error() const;

    const boost::json::object& metadata() const { return metadata_; }
    boost::json::object& metadata() { return metadata_; }

    void set_documents(std::vector<RetrievedDocument> documents);
    void set_reranked_documents(std::vector<RetrievedDocument> documents);
    void set_context(std::string context, std::vector<RetrievedDocument> used);
    void set_prompt(std::string prompt);
    void set_response(std::string response);
    void set_sources(std::vector<Citation> sources);

    // Moves forward to `next`. Throws std::logic_error on a backwards or
    // post-failure transition.
    void advance(Stage next);

    // Records the error and moves to FAILED.
    void fail(PipelineError error);

    // Response as stored, regardless of stage; for diagnostics and audit.
    const std::optional<std::string>& raw_response() const { return response_; }

private:
    void ensure_mutable(const char* field) const;

    Stage stage_ = Stage::START;
    std::string query_;
    std::vector<RetrievedDocument> documents_;
    std::optional<std::vector<RetrievedDocument>> reranked_documents_;
    std::optional<std::string> context_;
    std::vector<RetrievedDocument> context_documents_;
    std::optional<std::string> prompt_;
    std::optional<std::string> response_;
    std::vector<Citation> sources_;
    std::optional<PipelineError> error_;
    boost::json::object metadata_;
};

} // namespace pipeline
} // namespace crimrag
