#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace crimrag {

struct ServiceConfig {
    std::string url;            // base URL, e.g. http://localhost:6333
    std::string api_key;
    uint32_t timeout_ms = 30000;
    bool enabled = true;
};

struct ChunkingConfig {
    std::size_t target_tokens = 650;
    double overlap_ratio = 0.15;
    double boundary_tolerance = 0.20;
};

struct RetrievalConfig {
    std::size_t min_k = 3;
    std::size_t max_k = 10;
    std::size_t default_k = 5;
    std::size_t oversample_factor = 3;
    double diversity_lambda = 0.5;
};

struct RerankerConfig {
    bool enabled = false;
    ServiceConfig service{"http://localhost:8712", "", 10000, true};
    std::string model = "cross-encoder/ms-marco-MiniLM-L-6-v2";
    std::size_t top_n = 0;      // 0 keeps every document
};

struct GenerationConfig {
    ServiceConfig service{"https://api.groq.com/openai/v1", "", 60000, true};
    std::string model = "llama-3.3-70b-versatile";
    double temperature = 0.7;
    std::size_t max_tokens = 1200;
    uint32_t max_retries = 3;
    uint32_t initial_backoff_ms = 1000;
    double backoff_multiplier = 2.0;
    uint32_t max_backoff_ms = 60000;
};

struct EmbeddingConfig {
    std::string backend = "http";   // http | hashing
    ServiceConfig service{"http://localhost:8711", "", 30000, true};
    std::string model = "BAAI/bge-m3";
    std::size_t dimension = 1024;
};

struct IndexConfig {
    std::string backend = "qdrant"; // qdrant | memory
    ServiceConfig service{"http://localhost:6333", "", 30000, true};
    std::string collection = "criminology_corpus";
    std::string corpus_dir;          // documents loaded into the memory backend at startup
};

struct PipelineConfig {
    std::size_t max_context_tokens = 3000;
    std::size_t max_query_chars = 2000;
    std::size_t max_concurrent_queries = 4;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    bool console_output = true;
};

struct AuditConfig {
    bool enabled = true;
    std::string directory = "logs";
};

struct Config {
    ChunkingConfig chunking;
    RetrievalConfig retrieval;
    RerankerConfig reranker;
    GenerationConfig generation;
    EmbeddingConfig embedding;
    IndexConfig index;
    PipelineConfig pipeline;
    LoggingConfig logging;
    AuditConfig audit;
    std::string config_file;

    // Throws ConfigError on out-of-range values.
    void validate() const;
};

// Load configuration from YAML file. A missing file yields the defaults;
// a malformed file throws ConfigError. Environment overrides are applied
// and the result is validated.
Config load_config(const std::string& config_file = "config.yaml");

// Parse configuration from a YAML document held in memory.
Config load_config_from_string(const std::string& yaml_text);

// CRIMRAG_GENERATION_API_KEY, CRIMRAG_GENERATION_MODEL, CRIMRAG_LOG_LEVEL,
// CRIMRAG_INDEX_URL, CRIMRAG_USE_RERANKER
void apply_env_overrides(Config& config);

} // namespace crimrag
