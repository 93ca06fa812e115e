#include "crimrag/pipeline/pipeline.hpp"
#include "crimrag/error.hpp"
#include "crimrag/generation/prompts.hpp"
#include "crimrag/logging.hpp"
#include "crimrag/pipeline/context_builder.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <future>
#include <thread>

namespace crimrag {
namespace pipeline {

namespace {

namespace prompts = generation::prompts;

// Adds the elapsed milliseconds to metadata.timings_ms.<stage> on scope exit.
class StageTimer {
public:
    StageTimer(PipelineState& state, const char* stage)
        : state_(state),
          stage_(stage),
          start_(std::chrono::steady_clock::now()) {}

    ~StageTimer() {
        const double elapsed =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
        auto& metadata = state_.metadata();
        if (!metadata.contains("timings_ms")) {
            metadata["timings_ms"] = boost::json::object();
        }
        metadata["timings_ms"].as_object()[stage_] = elapsed;
    }

    StageTimer(const StageTimer&) = delete;
    StageTimer& operator=(const StageTimer&) = delete;

private:
    PipelineState& state_;
    const char* stage_;
    std::chrono::steady_clock::time_point start_;
};

std::shared_ptr<const PipelineContext> require_context(std::shared_ptr<const PipelineContext> context) {
    CRIMRAG_CHECK_ARGUMENT(context != nullptr, "Pipeline needs a context");
    CRIMRAG_CHECK_ARGUMENT(context->index != nullptr, "Pipeline needs an index adapter");
    CRIMRAG_CHECK_ARGUMENT(context->generator != nullptr, "Pipeline needs a generation client");
    return context;
}

std::string preview(const std::string& query) {
    return query.size() > 50 ? query.substr(0, 50) + "..." : query;
}

} // namespace

QueryResult to_query_result(const PipelineState& state) {
    QueryResult result;
    result.response = state.response();
    result.sources = state.sources().value_or(std::vector<Citation>{});
    result.error = state.error();
    result.metadata = state.metadata();
    result.metadata["stage"] = stage_name(state.stage());
    return result;
}

Pipeline::Pipeline(std::shared_ptr<const PipelineContext> context, Sleeper sleeper)
    : context_(require_context(std::move(context))),
      retriever_(context_->index, context_->config.retrieval),
      pass_through_reranker_(retrieval::make_reranker(false, nullptr)),
      scoring_reranker_(retrieval::make_reranker(true, context_->scorer, context_->config.reranker.top_n)),
      sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

void Pipeline::validate(const std::string& query, const QueryOptions& options) const {
    const auto& limits = context_->config.pipeline;
    CRIMRAG_CHECK_ARGUMENT(query.find_first_not_of(" \t\r\n") != std::string::npos, "query must not be empty");
    CRIMRAG_CHECK_ARGUMENT(query.size() <= limits.max_query_chars,
                           "query exceeds " + std::to_string(limits.max_query_chars) + " characters");
    CRIMRAG_CHECK_ARGUMENT(query.find('\0') == std::string::npos, "query contains NUL bytes");
    CRIMRAG_CHECK_ARGUMENT(!options.k || *options.k > 0, "k must be positive");
    CRIMRAG_CHECK_ARGUMENT(!options.max_context_tokens || *options.max_context_tokens > 0,
                           "max_context_tokens must be positive");
    CRIMRAG_CHECK_ARGUMENT(!options.timeout || options.timeout->count() > 0, "timeout must be positive");
    CRIMRAG_CHECK_ARGUMENT(!options.diversity_lambda || !std::isnan(*options.diversity_lambda),
                           "diversity_lambda must be a number");
}

std::chrono::milliseconds Pipeline::backoff_delay(uint32_t attempt) const {
    const auto& generation = context_->config.generation;
    const double raw = generation.initial_backoff_ms * std::pow(generation.backoff_multiplier, attempt);
    const double capped = std::min(raw, static_cast<double>(generation.max_backoff_ms));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

std::chrono::milliseconds Pipeline::index_timeout(const QueryOptions& options) const {
    return options.timeout.value_or(std::chrono::milliseconds(context_->config.index.service.timeout_ms));
}

std::chrono::milliseconds Pipeline::generation_timeout(const QueryOptions& options) const {
    return options.timeout.value_or(std::chrono::milliseconds(context_->config.generation.service.timeout_ms));
}

bool Pipeline::check_cancelled(PipelineState& state, const QueryOptions& options, const char* stage) const {
    if (options.cancel && options.cancel->is_cancelled()) {
        LOG_INFO(std::string("Query cancelled before ") + stage);
        state.fail(PipelineError::from_exception(CancelledError(stage)));
        return true;
    }
    return false;
}

QueryResult Pipeline::run(const std::string& query, const QueryOptions& options) const {
    try {
        return to_query_result(execute(query, options));
    } catch (const InputError& e) {
        LOG_WARNING("Query rejected: " + std::string(e.what()));
        QueryResult result;
        result.error = PipelineError::from_exception(e);
        result.metadata["stage"] = "rejected";
        return result;
    }
}

PipelineState Pipeline::execute(const std::string& query, const QueryOptions& options) const {
    validate(query, options);

    LOG_DEBUG("Processing query: " + preview(query));
    PipelineState state(query);
    state.metadata()["query_type"] = prompts::query_type_name(prompts::classify_query_type(query));
    if (!options.filters.empty()) {
        state.metadata()["filters"] = options.filters.describe();
    }

    {
        StageTimer total(state, "total");
        if (retrieve_stage(state, options) &&
            rerank_stage(state, options) &&
            generate_stage(state, options) &&
            format_stage(state, options)) {
            state.advance(Stage::DONE);
        }
    }

    if (const auto error = state.error()) {
        LOG_ERROR("Query failed (" + std::string(error_code_name(error->kind)) + "): " + error->message);
    } else {
        LOG_INFO("Query completed with " + std::to_string(state.context_documents().size()) +
                 " context documents");
    }

    write_audit(state);
    return state;
}

bool Pipeline::retrieve_stage(PipelineState& state, const QueryOptions& options) const {
    if (check_cancelled(state, options, "retrieve")) {
        return false;
    }
    StageTimer timer(state, "retrieve");

    std::vector<RetrievedDocument> documents;
    try {
        documents = retriever_.retrieve(state.query(), options.k, options.filters, options.diversity_lambda,
                                        index_timeout(options));
    } catch (const CrimragException& e) {
        state.fail(PipelineError::from_exception(e));
        return false;
    }

    state.metadata()["retrieved_count"] = documents.size();
    if (documents.empty()) {
        state.metadata()["empty_result"] = true;
    }
    state.set_documents(std::move(documents));
    state.advance(Stage::RETRIEVED);
    return true;
}

bool Pipeline::rerank_stage(PipelineState& state, const QueryOptions& options) const {
    if (state.documents().empty()) {
        return true;
    }
    if (check_cancelled(state, options, "rerank")) {
        return false;
    }

    const bool enabled = options.use_reranker.value_or(context_->config.reranker.enabled);
    const auto& reranker = enabled ? scoring_reranker_ : pass_through_reranker_;
    StageTimer timer(state, "rerank");

    retrieval::RerankOutcome outcome = reranker->rerank(state.query(), state.documents());
    state.metadata()["reranker"] = reranker->name();
    if (outcome.failure) {
        state.metadata()["rerank_error"] = *outcome.failure;
        return true;
    }
    if (outcome.applied) {
        state.metadata()["reranked_count"] = outcome.documents.size();
        state.set_reranked_documents(std::move(outcome.documents));
        state.advance(Stage::RERANKED);
    }
    return true;
}

bool Pipeline::generate_stage(PipelineState& state, const QueryOptions& options) const {
    if (check_cancelled(state, options, "generate")) {
        return false;
    }
    StageTimer timer(state, "generate");

    const auto query_type = prompts::classify_query_type(state.query());

    BuiltContext built;
    if (!state.active_documents().empty()) {
        const std::size_t max_tokens =
            options.max_context_tokens.value_or(context_->config.pipeline.max_context_tokens);
        built = build_context(state.active_documents(), max_tokens);
        state.metadata()["context_tokens"] = built.token_count;
        if (built.truncated) {
            state.metadata()["context_truncated"] = true;
        }
    }
    state.metadata()["context_documents"] = built.documents.size();

    // Nothing fits the context: answer without calling the generator.
    if (built.documents.empty()) {
        state.set_context("", {});
        state.set_prompt(prompts::format_prompt_with_context(state.query(), "", query_type));
        state.set_response(prompts::insufficient_evidence_message());
        state.metadata()["generation_attempts"] = 0;
        state.advance(Stage::GENERATED);
        return true;
    }

    std::string prompt = prompts::format_prompt_with_context(state.query(), built.text, query_type);
    state.set_context(std::move(built.text), std::move(built.documents));
    state.set_prompt(prompt);

    std::string response;
    try {
        response = generate_with_retry(state, prompt, options);
    } catch (const CrimragException& e) {
        state.fail(PipelineError::from_exception(e));
        return false;
    }

    state.set_response(std::move(response));
    state.advance(Stage::GENERATED);
    return true;
}

std::string Pipeline::generate_with_retry(PipelineState& state, const std::string& prompt,
                                          const QueryOptions& options) const {
    const auto& generation = context_->config.generation;
    const auto timeout = generation_timeout(options);

    for (uint32_t attempt = 0;; ++attempt) {
        if (options.cancel && options.cancel->is_cancelled()) {
            throw CancelledError("generate");
        }
        state.metadata()["generation_attempts"] = attempt + 1;

        std::optional<GenerationError> failure;
        try {
            return context_->generator->generate(prompt, generation.max_tokens, timeout);
        } catch (const GenerationError& e) {
            failure = e;
        } catch (const CrimragException&) {
            throw;
        } catch (const std::exception& e) {
            failure = GenerationError(GenerationErrorKind::UNAVAILABLE, e.what(), "Pipeline::generate");
        }

        if (attempt >= generation.max_retries) {
            LOG_ERROR("Generation failed after " + std::to_string(attempt + 1) + " attempts: " + failure->what());
            throw *failure;
        }

        const auto delay = backoff_delay(attempt);
        LOG_WARNING(std::string("Generation attempt ") + std::to_string(attempt + 1) + " failed (" +
                    generation_error_kind_name(failure->kind()) + "), retrying in " +
                    std::to_string(delay.count()) + " ms");
        sleeper_(delay);
    }
}

bool Pipeline::format_stage(PipelineState& state, const QueryOptions& options) const {
    if (check_cancelled(state, options, "format")) {
        return false;
    }
    StageTimer timer(state, "format");

    FormattedResponse formatted;
    try {
        formatted = formatter_.format(state.raw_response().value_or(""), state.context_documents());
    } catch (const FormatError& e) {
        state.fail(PipelineError::from_exception(e));
        return false;
    }

    state.metadata()["sources_count"] = formatted.citations.size();
    state.set_response(std::move(formatted.text));
    state.set_sources(std::move(formatted.citations));
    state.advance(Stage::FORMATTED);
    return true;
}

void Pipeline::write_audit(const PipelineState& state) const {
    if (!context_->audit) {
        return;
    }
    try {
        context_->audit->record(make_audit_record(state));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write audit record: " + std::string(e.what()));
    }
}

std::vector<QueryResult> Pipeline::run_batch(const std::vector<std::string>& queries,
                                             const QueryOptions& options) const {
    std::vector<QueryResult> results(queries.size());
    if (queries.empty()) {
        return results;
    }

    const std::size_t workers = std::min(context_->config.pipeline.max_concurrent_queries, queries.size());
    std::atomic<std::size_t> next{0};

    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [&]() {
            for (std::size_t i = next.fetch_add(1); i < queries.size(); i = next.fetch_add(1)) {
                results[i] = run(queries[i], options);
            }
        }));
    }
    for (auto& future : futures) {
        future.get();
    }

    LOG_INFO("Batch of " + std::to_string(queries.size()) + " queries finished");
    return results;
}

} // namespace pipeline
} // namespace crimrag
