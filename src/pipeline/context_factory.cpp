#include "crimrag/pipeline/context_factory.hpp"
#include "crimrag/chunking/chunker.hpp"
#include "crimrag/error.hpp"
#include "crimrag/generation/chat_completion_client.hpp"
#include "crimrag/generation/prompts.hpp"
#include "crimrag/index/embedding_client.hpp"
#include "crimrag/index/in_memory_index.hpp"
#include "crimrag/index/qdrant_index.hpp"
#include "crimrag/ingest/ingestor.hpp"
#include "crimrag/logging.hpp"
#include "crimrag/retrieval/scoring_client.hpp"

namespace crimrag {
namespace pipeline {

std::shared_ptr<index::TextEmbedder> make_embedder(const EmbeddingConfig& config,
                                                   std::shared_ptr<net::HttpClient> http_client) {
    if (config.backend == "hashing") {
        return std::make_shared<index::HashingEmbedder>(config.dimension);
    }
    if (config.backend == "http") {
        return std::make_shared<index::EmbeddingClient>(std::move(http_client), config);
    }
    throw ConfigError("unknown embedding backend '" + config.backend + "', use 'http' or 'hashing'",
                      "make_embedder");
}

std::shared_ptr<index::IndexAdapter> make_index(const Config& config,
                                                std::shared_ptr<index::TextEmbedder> embedder,
                                                std::shared_ptr<net::HttpClient> http_client) {
    if (config.index.backend == "qdrant") {
        return std::make_shared<index::QdrantIndex>(std::move(http_client), std::move(embedder), config.index);
    }
    if (config.index.backend != "memory") {
        throw ConfigError("unknown index backend '" + config.index.backend + "', use 'qdrant' or 'memory'",
                          "make_index");
    }

    auto memory = std::make_shared<index::InMemoryIndex>(std::move(embedder), config.index.collection);
    if (!config.index.corpus_dir.empty()) {
        const ingest::Ingestor ingestor(memory, chunking::Chunker(config.chunking));
        const std::chrono::milliseconds timeout(config.embedding.service.timeout_ms);
        for (const auto& document : ingest::load_corpus(config.index.corpus_dir)) {
            ingestor.ingest(document, timeout);
        }
        LOG_INFO("In-memory index holds " + std::to_string(memory->size()) + " chunks");
    }
    return memory;
}

std::shared_ptr<PipelineContext> make_pipeline_context(const Config& config,
                                                       std::shared_ptr<net::HttpClient> http_client) {
    auto context = std::make_shared<PipelineContext>();
    context->config = config;

    auto embedder = make_embedder(config.embedding, http_client);
    context->index = make_index(config, std::move(embedder), http_client);
    context->generator = std::make_shared<generation::ChatCompletionClient>(
        http_client, config.generation, generation::prompts::system_prompt());

    // Per-query use_reranker needs a scorer even when reranking is off by default.
    if (config.reranker.service.enabled) {
        context->scorer = std::make_shared<retrieval::HttpScoringClient>(http_client, config.reranker);
    }
    if (config.audit.enabled) {
        context->audit = std::make_shared<JsonlAuditLog>(config.audit.directory);
    }

    LOG_INFO("Pipeline context ready (index: " + config.index.backend + ", embedding: " +
             config.embedding.backend + ", reranker: " + (config.reranker.enabled ? "on" : "off") + ")");
    return context;
}

} // namespace pipeline
} // namespace crimrag
