#include "crimrag/config.hpp"
#include "crimrag/error.hpp"
#include "crimrag/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace crimrag {

namespace {

template <typename T>
void read_value(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

void read_service(const YAML::Node& node, ServiceConfig& service) {
    if (!node) {
        return;
    }
    read_value(node, "url", service.url);
    read_value(node, "api_key", service.api_key);
    read_value(node, "timeout_ms", service.timeout_ms);
    read_value(node, "enabled", service.enabled);
}

void apply_yaml(const YAML::Node& yaml, Config& config) {
    if (!yaml || yaml.IsNull()) {
        return;
    }
    if (!yaml.IsMap()) {
        throw ConfigError("top-level YAML node must be a mapping", "load_config");
    }

    if (yaml["chunking"]) {
        const auto& node = yaml["chunking"];
        read_value(node, "target_tokens", config.chunking.target_tokens);
        read_value(node, "overlap_ratio", config.chunking.overlap_ratio);
        read_value(node, "boundary_tolerance", config.chunking.boundary_tolerance);
    }

    if (yaml["retrieval"]) {
        const auto& node = yaml["retrieval"];
        read_value(node, "min_k", config.retrieval.min_k);
        read_value(node, "max_k", config.retrieval.max_k);
        read_value(node, "default_k", config.retrieval.default_k);
        read_value(node, "oversample_factor", config.retrieval.oversample_factor);
        read_value(node, "diversity_lambda", config.retrieval.diversity_lambda);
    }

    if (yaml["reranker"]) {
        const auto& node = yaml["reranker"];
        read_value(node, "enabled", config.reranker.enabled);
        read_value(node, "model", config.reranker.model);
        read_value(node, "top_n", config.reranker.top_n);
        read_service(node["service"], config.reranker.service);
    }

    if (yaml["generation"]) {
        const auto& node = yaml["generation"];
        read_service(node["service"], config.generation.service);
        read_value(node, "model", config.generation.model);
        read_value(node, "temperature", config.generation.temperature);
        read_value(node, "max_tokens", config.generation.max_tokens);
        read_value(node, "max_retries", config.generation.max_retries);
        read_value(node, "initial_backoff_ms", config.generation.initial_backoff_ms);
        read_value(node, "backoff_multiplier", config.generation.backoff_multiplier);
        read_value(node, "max_backoff_ms", config.generation.max_backoff_ms);
    }

    if (yaml["embedding"]) {
        const auto& node = yaml["embedding"];
        read_value(node, "backend", config.embedding.backend);
        read_service(node["service"], config.embedding.service);
        read_value(node, "model", config.embedding.model);
        read_value(node, "dimension", config.embedding.dimension);
    }

    if (yaml["index"]) {
        const auto& node = yaml["index"];
        read_value(node, "backend", config.index.backend);
        read_service(node["service"], config.index.service);
        read_value(node, "collection", config.index.collection);
        read_value(node, "corpus_dir", config.index.corpus_dir);
    }

    if (yaml["pipeline"]) {
        const auto& node = yaml["pipeline"];
        read_value(node, "max_context_tokens", config.pipeline.max_context_tokens);
        read_value(node, "max_query_chars", config.pipeline.max_query_chars);
        read_value(node, "max_concurrent_queries", config.pipeline.max_concurrent_queries);
    }

    if (yaml["logging"]) {
        const auto& node = yaml["logging"];
        read_value(node, "level", config.logging.level);
        read_value(node, "file", config.logging.file);
        read_value(node, "console_output", config.logging.console_output);
    }

    if (yaml["audit"]) {
        const auto& node = yaml["audit"];
        read_value(node, "enabled", config.audit.enabled);
        read_value(node, "directory", config.audit.directory);
    }
}

bool parse_bool(const std::string& raw, const char* variable) {
    std::string value = raw;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw ConfigError(std::string("invalid boolean in ") + variable + ": '" + raw + "'", "apply_env_overrides");
}

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

void Config::validate() const {
    if (chunking.target_tokens == 0) {
        throw ConfigError("chunking.target_tokens must be positive", "Config::validate");
    }
    if (chunking.overlap_ratio < 0.0 || chunking.overlap_ratio >= 0.5) {
        throw ConfigError("chunking.overlap_ratio must be in [0, 0.5)", "Config::validate");
    }
    if (chunking.boundary_tolerance < 0.0 || chunking.boundary_tolerance >= 1.0) {
        throw ConfigError("chunking.boundary_tolerance must be in [0, 1)", "Config::validate");
    }
    if (retrieval.min_k == 0 || retrieval.min_k > retrieval.max_k) {
        throw ConfigError("retrieval.min_k must be positive and not above max_k", "Config::validate");
    }
    if (retrieval.default_k < retrieval.min_k || retrieval.default_k > retrieval.max_k) {
        throw ConfigError("retrieval.default_k must lie in [min_k, max_k]", "Config::validate");
    }
    if (retrieval.oversample_factor == 0) {
        throw ConfigError("retrieval.oversample_factor must be positive", "Config::validate");
    }
    if (retrieval.diversity_lambda < 0.0 || retrieval.diversity_lambda > 1.0) {
        throw ConfigError("retrieval.diversity_lambda must be in [0, 1]", "Config::validate");
    }
    if (generation.backoff_multiplier < 1.0) {
        throw ConfigError("generation.backoff_multiplier must be >= 1", "Config::validate");
    }
    if (generation.max_backoff_ms < generation.initial_backoff_ms) {
        throw ConfigError("generation.max_backoff_ms must be >= initial_backoff_ms", "Config::validate");
    }
    if (generation.max_tokens == 0) {
        throw ConfigError("generation.max_tokens must be positive", "Config::validate");
    }
    if (embedding.backend != "http" && embedding.backend != "hashing") {
        throw ConfigError("embedding.backend must be 'http' or 'hashing'", "Config::validate");
    }
    if (embedding.dimension == 0) {
        throw ConfigError("embedding.dimension must be positive", "Config::validate");
    }
    if (index.backend != "qdrant" && index.backend != "memory") {
        throw ConfigError("index.backend must be 'qdrant' or 'memory'", "Config::validate");
    }
    if (pipeline.max_context_tokens == 0 || pipeline.max_query_chars == 0) {
        throw ConfigError("pipeline limits must be positive", "Config::validate");
    }
    if (pipeline.max_concurrent_queries == 0) {
        throw ConfigError("pipeline.max_concurrent_queries must be positive", "Config::validate");
    }
    parse_log_level(logging.level);

    if (chunking.overlap_ratio < 0.10 || chunking.overlap_ratio > 0.20) {
        LOG_WARNING("chunking.overlap_ratio " + std::to_string(chunking.overlap_ratio) +
                    " is outside the recommended 0.10-0.20 range");
    }
}

void apply_env_overrides(Config& config) {
    if (const char* value = env("CRIMRAG_GENERATION_API_KEY")) {
        config.generation.service.api_key = value;
    }
    if (const char* value = env("CRIMRAG_GENERATION_MODEL")) {
        config.generation.model = value;
    }
    if (const char* value = env("CRIMRAG_LOG_LEVEL")) {
        config.logging.level = value;
    }
    if (const char* value = env("CRIMRAG_INDEX_URL")) {
        config.index.service.url = value;
    }
    if (const char* value = env("CRIMRAG_USE_RERANKER")) {
        config.reranker.enabled = parse_bool(value, "CRIMRAG_USE_RERANKER");
    }
}

Config load_config_from_string(const std::string& yaml_text) {
    Config config;
    try {
        apply_yaml(YAML::Load(yaml_text), config);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what(), "load_config_from_string");
    }
    apply_env_overrides(config);
    config.validate();
    return config;
}

Config load_config(const std::string& config_file) {
    Config config;
    config.config_file = config_file;

    std::error_code ec;
    if (!config_file.empty() && std::filesystem::exists(config_file, ec)) {
        try {
            apply_yaml(YAML::LoadFile(config_file), config);
        } catch (const YAML::Exception& e) {
            throw ConfigError("invalid configuration in " + config_file + ": " + e.what(), "load_config");
        }
    } else if (!config_file.empty()) {
        LOG_INFO("Configuration file " + config_file + " not found, using defaults");
    }

    apply_env_overrides(config);
    config.validate();
    return config;
}

} // namespace crimrag
