#include "crimrag/index/qdrant_index.hpp"
#include "crimrag/error.hpp"
#include "crimrag/logging.hpp"
#include "crimrag/util/vector_ops.hpp"

#include <charconv>

namespace crimrag {
namespace index {

namespace {

std::string get_string(const boost::json::object& obj, const char* key) {
    const auto* value = obj.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        return "";
    }
    return std::string(value->as_string());
}

template <typename T>
T get_number(const boost::json::object& obj, const char* key, T fallback) {
    const auto* value = obj.if_contains(key);
    if (value == nullptr || !value->is_number()) {
        return fallback;
    }
    return value->to_number<T>();
}

void put_if_present(boost::json::object& payload, const char* key, const std::string& value) {
    if (!value.empty()) {
        payload[key] = value;
    }
}

} // namespace

QdrantIndex::QdrantIndex(std::shared_ptr<net::HttpClient> http_client,
                         std::shared_ptr<TextEmbedder> embedder,
                         IndexConfig config)
    : http_client_(std::move(http_client)),
      embedder_(std::move(embedder)),
      config_(std::move(config)) {
    CRIMRAG_CHECK_ARGUMENT(http_client_ != nullptr, "QdrantIndex needs an HTTP client");
    CRIMRAG_CHECK_ARGUMENT(embedder_ != nullptr, "QdrantIndex needs an embedder");
}

Embedding QdrantIndex::embed(const std::string& text, std::chrono::milliseconds timeout) {
    return embedder_->embed(text, timeout);
}

std::vector<IndexCandidate> QdrantIndex::similarity_search(const Embedding& embedding,
                                                           std::size_t k,
                                                           const MetadataFilter& filter,
                                                           std::chrono::milliseconds timeout) {
    boost::json::object request;
    boost::json::array vector_array;
    for (float value : embedding) {
        vector_array.push_back(value);
    }
    request["vector"] = std::move(vector_array);
    request["limit"] = k;
    request["with_payload"] = true;
    request["with_vector"] = true;
    if (!filter.empty()) {
        request["filter"] = build_filter(filter);
    }

    const boost::json::value body(std::move(request));
    const net::HttpResponse response = call("POST", collection_path("/points/search"), &body, timeout,
                                            "similarity_search");

    std::vector<IndexCandidate> candidates;
    try {
        const boost::json::value val = boost::json::parse(response.body);
        const auto& hits = val.as_object().at("result").as_array();
        candidates.reserve(hits.size());
        for (const auto& hit : hits) {
            candidates.push_back(parse_point(hit.as_object(), config_.collection));
        }
    } catch (const std::exception& e) {
        throw IndexUnavailableError(std::string("invalid search response: ") + e.what(),
                                    "QdrantIndex::similarity_search");
    }

    LOG_DEBUG("Qdrant returned " + std::to_string(candidates.size()) + " candidates from " +
              config_.collection);
    return candidates;
}

void QdrantIndex::upsert(const std::vector<IndexedChunk>& chunks, std::chrono::milliseconds timeout) {
    if (chunks.empty()) {
        return;
    }

    boost::json::array points;
    for (const auto& item : chunks) {
        const Embedding embedding = embedder_->embed(item.chunk.text, timeout);

        boost::json::object point;
        point["id"] = util::uuid_from_key(item.chunk.id);
        boost::json::array vector_array;
        for (float value : embedding) {
            vector_array.push_back(value);
        }
        point["vector"] = std::move(vector_array);
        point["payload"] = build_payload(item.chunk, item.metadata);
        points.push_back(std::move(point));
    }

    boost::json::object request;
    request["points"] = std::move(points);
    const boost::json::value body(std::move(request));
    call("PUT", collection_path("/points?wait=true"), &body, timeout, "upsert");

    LOG_INFO("Upserted " + std::to_string(chunks.size()) + " chunks into " + config_.collection);
}

bool QdrantIndex::is_healthy() {
    try {
        call("GET", collection_path(), nullptr, std::chrono::milliseconds(config_.service.timeout_ms),
             "is_healthy");
        return true;
    } catch (const IndexUnavailableError& e) {
        LOG_WARNING("Qdrant health check failed: " + std::string(e.what()));
        return false;
    }
}

void QdrantIndex::ensure_collection(std::size_t dimension, std::chrono::milliseconds timeout) {
    const net::HttpResponse existing = [&] {
        try {
            return http_client_->send_request("GET", net::join_url(config_.service.url, collection_path()),
                                              "", {}, timeout);
        } catch (const net::HttpTransportError& e) {
            throw IndexUnavailableError(std::string("Qdrant unreachable: ") + e.what(),
                                        "QdrantIndex::ensure_collection");
        }
    }();
    if (existing.ok()) {
        return;
    }

    boost::json::object vectors;
    vectors["size"] = dimension;
    vectors["distance"] = "Cosine";
    boost::json::object request;
    request["vectors"] = std::move(vectors);

    const boost::json::value body(std::move(request));
    call("PUT", collection_path(), &body, timeout, "ensure_collection");
    LOG_INFO("Created Qdrant collection " + config_.collection + " (dimension " +
             std::to_string(dimension) + ")");
}

boost::json::object QdrantIndex::build_filter(const MetadataFilter& filter) {
    boost::json::array must;
    for (const auto& [field, accepted] : filter.predicates()) {
        boost::json::object match;
        if (accepted.size() == 1) {
            match["value"] = *accepted.begin();
        } else {
            boost::json::array any;
            for (const auto& value : accepted) {
                any.push_back(boost::json::string(value));
            }
            match["any"] = std::move(any);
        }

        boost::json::object condition;
        condition["key"] = field;
        condition["match"] = std::move(match);
        must.push_back(std::move(condition));
    }

    boost::json::object result;
    result["must"] = std::move(must);
    return result;
}

boost::json::object QdrantIndex::build_payload(const Chunk& chunk, const DocumentMetadata& metadata) {
    boost::json::object payload;
    payload["chunk_id"] = chunk.id;
    payload["document_id"] = chunk.source_document_id;
    payload["chunk_index"] = chunk.index;
    payload["text"] = chunk.text;
    payload["token_count"] = chunk.token_count;
    payload["overlap_ratio"] = chunk.overlap_ratio;
    payload["overlap_tokens"] = chunk.overlap_tokens;
    payload["content_type"] = content_type_name(chunk.content_type);
    payload["section_id"] = chunk.section_id;
    payload["confidence_level"] = chunk.confidence_level;
    payload["start_offset"] = chunk.start_offset;
    payload["core_offset"] = chunk.core_offset;
    payload["end_offset"] = chunk.end_offset;

    for (const auto& field : DocumentMetadata::field_names()) {
        if (const auto value = metadata.field(field)) {
            payload[field] = *value;
        }
    }
    return payload;
}

IndexCandidate QdrantIndex::parse_point(const boost::json::object& point, const std::string& collection) {
    const auto& payload = point.at("payload").as_object();

    auto chunk = std::make_shared<Chunk>();
    chunk->id = get_string(payload, "chunk_id");
    chunk->source_document_id = get_string(payload, "document_id");
    chunk->index = get_number<std::size_t>(payload, "chunk_index", 0);
    chunk->text = get_string(payload, "text");
    chunk->token_count = get_number<std::size_t>(payload, "token_count", 0);
    chunk->overlap_ratio = get_number<double>(payload, "overlap_ratio", 0.0);
    chunk->overlap_tokens = get_number<std::size_t>(payload, "overlap_tokens", 0);
    chunk->content_type = parse_content_type(get_string(payload, "content_type"))
                              .value_or(ContentType::UNCLASSIFIED);
    chunk->section_id = get_string(payload, "section_id");
    chunk->confidence_level = get_number<float>(payload, "confidence_level", 0.0f);
    chunk->start_offset = get_number<std::size_t>(payload, "start_offset", 0);
    chunk->core_offset = get_number<std::size_t>(payload, "core_offset", 0);
    chunk->end_offset = get_number<std::size_t>(payload, "end_offset", 0);

    if (chunk->id.empty()) {
        throw std::runtime_error("point payload has no chunk_id");
    }

    DocumentMetadata metadata;
    metadata.source = get_string(payload, "source");
    metadata.crime_type = get_string(payload, "crime_type");
    metadata.offender_type = get_string(payload, "offender_type");
    metadata.victimology = get_string(payload, "victimology");
    metadata.modus_operandi = get_string(payload, "modus_operandi");
    metadata.signature_behavior = get_string(payload, "signature_behavior");
    metadata.geography = get_string(payload, "geography");
    metadata.time_period = get_string(payload, "time_period");
    metadata.document_authority = get_string(payload, "document_authority");
    metadata.source_reliability = parse_reliability(get_string(payload, "source_reliability"));

    const std::string year = get_string(payload, "publication_year");
    int parsed_year = 0;
    const auto [end, ec] = std::from_chars(year.data(), year.data() + year.size(), parsed_year);
    if (!year.empty() && ec == std::errc() && end == year.data() + year.size()) {
        metadata.publication_year = parsed_year;
    }

    IndexCandidate candidate;
    candidate.chunk = std::move(chunk);
    candidate.metadata = std::move(metadata);
    candidate.score = get_number<float>(point, "score", 0.0f);
    candidate.collection_name = collection;
    if (const auto* vector = point.if_contains("vector"); vector != nullptr && vector->is_array()) {
        for (const auto& value : vector->as_array()) {
            candidate.embedding.push_back(static_cast<float>(value.to_number<double>()));
        }
    }
    return candidate;
}

net::HttpResponse QdrantIndex::call(const std::string& method, const std::string& path,
                                    const boost::json::value* body, std::chrono::milliseconds timeout,
                                    const char* operation) {
    net::HttpHeaders headers;
    if (!config_.service.api_key.empty()) {
        headers["api-key"] = config_.service.api_key;
    }

    net::HttpResponse response;
    try {
        response = http_client_->send_request(method, net::join_url(config_.service.url, path),
                                              body ? boost::json::serialize(*body) : std::string(),
                                              headers, timeout);
    } catch (const net::HttpTransportError& e) {
        throw IndexUnavailableError(std::string(e.timed_out() ? "Qdrant timed out: " : "Qdrant unreachable: ") +
                                        e.what(),
                                    std::string("QdrantIndex::") + operation);
    }

    if (!response.ok()) {
        throw IndexUnavailableError("Qdrant returned HTTP " + std::to_string(response.status) + ": " +
                                        response.body.substr(0, 200),
                                    std::string("QdrantIndex::") + operation);
    }
    return response;
}

std::string QdrantIndex::collection_path(const std::string& suffix) const {
    return "collections/" + config_.collection + suffix;
}

} // namespace index
} // namespace crimrag
