#include "crimrag/pipeline/pipeline_state.hpp"

#include <stdexcept>

namespace crimrag {
namespace pipeline {

const char* stage_name(Stage stage) noexcept {
    switch (stage) {
        case Stage::START: return "start";
        case Stage::RETRIEVED: return "retrieved";
        case Stage::RERANKED: return "reranked";
        case Stage::GENERATED: return "generated";
        case Stage::FORMATTED: return "formatted";
        case Stage::DONE: return "done";
        case Stage::FAILED: return "failed";
    }
    return "unknown";
}

PipelineError PipelineError::from_exception(const CrimragException& e) {
    PipelineError error;
    error.kind = e.code();
    error.message = e.what();
    if (const auto* generation = dynamic_cast<const GenerationError*>(&e)) {
        error.generation_kind = generation->kind();
    }
    return error;
}

PipelineState::PipelineState(std::string query)
    : query_(std::move(query)) {}

const std::vector<RetrievedDocument>& PipelineState::active_documents() const {
    return reranked_documents_ ? *reranked_documents_ : documents_;
}

std::optional<std::string> PipelineState::response() const {
    if (stage_ != Stage::DONE) {
        return std::nullopt;
    }
    return response_;
}

std::optional<std::vector<Citation>> PipelineState::sources() const {
    if (stage_ != Stage::DONE) {
        return std::nullopt;
    }
    return sources_;
}

std::optional<PipelineError> PipelineState::error() const {
    if (stage_ != Stage::FAILED) {
        return std::nullopt;
    }
    return error_;
}

void PipelineState::ensure_mutable(const char* field) const {
    if (error_) {
        throw std::logic_error(std::string("cannot set ") + field + " after the pipeline failed");
    }
}

void PipelineState::set_documents(std::vector<RetrievedDocument> documents) {
    ensure_mutable("documents");
    documents_ = std::move(documents);
}

void PipelineState::set_reranked_documents(std::vector<RetrievedDocument> documents) {
    ensure_mutable("reranked_documents");
    reranked_documents_ = std::move(documents);
}

void PipelineState::set_context(std::string context, std::vector<RetrievedDocument> used) {
    ensure_mutable("context");
    context_ = std::move(context);
    context_documents_ = std::move(used);
}

void PipelineState::set_prompt(std::string prompt) {
    ensure_mutable("prompt");
    prompt_ = std::move(prompt);
}

void PipelineState::set_response(std::string response) {
    ensure_mutable("response");
    response_ = std::move(response);
}

void PipelineState::set_sources(std::vector<Citation> sources) {
    ensure_mutable("sources");
    sources_ = std::move(sources);
}

void PipelineState::advance(Stage next) {
    if (stage_ == Stage::FAILED || stage_ == Stage::DONE) {
        throw std::logic_error(std::string("cannot leave terminal stage ") + stage_name(stage_));
    }
    if (next == Stage::FAILED || static_cast<int>(next) <= static_cast<int>(stage_)) {
        throw std::logic_error(std::string("invalid transition ") + stage_name(stage_) + " -> " +
                               stage_name(next));
    }
    stage_ = next;
}

void PipelineState::fail(PipelineError error) {
    if (stage_ == Stage::FAILED || stage_ == Stage::DONE) {
        throw std::logic_error(std::string("cannot fail from terminal stage ") + stage_name(stage_));
    }
    metadata_["failed_at"] = stage_name(stage_);
    error_ = std::move(error);
    stage_ = Stage::FAILED;
}

} // namespace pipeline
} // namespace crimrag
