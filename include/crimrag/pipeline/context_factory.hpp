#pragma once

#include "crimrag/config.hpp"
#include "crimrag/index/index_adapter.hpp"
#include "crimrag/net/http_client.hpp"
#include "crimrag/pipeline/pipeline.hpp"

#include <memory>

namespace crimrag {
namespace pipeline {

std::shared_ptr<index::TextEmbedder> make_embedder(const EmbeddingConfig& config,
                                                   std::shared_ptr<net::HttpClient> http_client);

// "memory" or "qdrant". Throws ConfigError on any other backend name.
std::shared_ptr<index::IndexAdapter> make_index(const Config& config,
                                                std::shared_ptr<index::TextEmbedder> embedder,
                                                std::shared_ptr<net::HttpClient> http_client);

/**
 * Wires every collaborator named by the configuration: the index adapter
 * (the memory backend is filled from index.corpus_dir when set), the chat
 * completion client, the scoring client when the reranker service is
 * configured and the JSONL audit log when auditing is enabled.
 */
std::shared_ptr<PipelineContext> make_pipeline_context(const Config& config,
                                                       std::shared_ptr<net::HttpClient> http_client);

} // namespace pipeline
} // namespace crimrag
