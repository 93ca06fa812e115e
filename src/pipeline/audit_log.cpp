#include "crimrag/pipeline/audit_log.hpp"
#include "crimrag/error.hpp"
#include "crimrag/logging.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>

namespace crimrag {
namespace pipeline {

namespace {

std::tm utc_time(std::chrono::system_clock::time_point timestamp) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    return tm;
}

long long microseconds_part(std::chrono::system_clock::time_point timestamp) {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::microseconds>(timestamp.time_since_epoch());
    return since_epoch.count() % 1000000;
}

std::string format_time(std::chrono::system_clock::time_point timestamp, const char* pattern) {
    const std::tm tm = utc_time(timestamp);
    char buffer[64];
    const std::size_t written = std::strftime(buffer, sizeof(buffer), pattern, &tm);
    return std::string(buffer, written);
}

std::string iso_timestamp(std::chrono::system_clock::time_point timestamp) {
    char micros[16];
    std::snprintf(micros, sizeof(micros), ".%06lld", microseconds_part(timestamp));
    return format_time(timestamp, "%Y-%m-%dT%H:%M:%S") + micros + "Z";
}

boost::json::object document_json(const RetrievedDocument& doc) {
    boost::json::object out;
    out["id"] = doc.chunk ? doc.chunk->id : std::string("unknown");
    out["source"] = doc.source_name();
    out["collection"] = doc.collection_name;
    out["rank"] = doc.rank;
    out["similarity_score"] = doc.similarity_score;
    if (doc.rerank_score) {
        out["rerank_score"] = *doc.rerank_score;
    } else {
        out["rerank_score"] = nullptr;
    }
    if (doc.chunk) {
        const std::string& text = doc.chunk->text;
        out["preview"] = text.size() > 200 ? text.substr(0, 200) + "..." : text;
    }
    return out;
}

boost::json::object citation_json(const Citation& citation) {
    boost::json::object out;
    out["number"] = citation.number;
    out["document_name"] = citation.document_name;
    if (citation.authority) out["authority"] = *citation.authority;
    if (citation.reliability) out["reliability"] = reliability_name(*citation.reliability);
    if (citation.year) out["year"] = *citation.year;
    if (citation.crime_type) out["crime_type"] = *citation.crime_type;
    boost::json::array chunk_ids;
    for (const auto& id : citation.chunk_ids) {
        chunk_ids.push_back(boost::json::string(id));
    }
    out["chunk_ids"] = std::move(chunk_ids);
    return out;
}

} // namespace

AuditRecord make_audit_record(const PipelineState& state, std::chrono::system_clock::time_point timestamp) {
    AuditRecord record;
    char micros[16];
    std::snprintf(micros, sizeof(micros), "_%06lld", microseconds_part(timestamp));
    record.log_id = "query_" + format_time(timestamp, "%Y%m%d_%H%M%S") + micros;
    record.timestamp = timestamp;
    record.query = state.query();
    record.stage = state.stage();
    record.documents = state.context() ? state.context_documents() : state.active_documents();
    record.prompt = state.prompt();
    record.response = state.response();
    record.sources = state.sources().value_or(std::vector<Citation>{});
    record.error = state.error();
    record.metadata = state.metadata();
    return record;
}

boost::json::object to_json(const AuditRecord& record) {
    boost::json::object out;
    out["log_id"] = record.log_id;
    out["timestamp"] = iso_timestamp(record.timestamp);
    out["stage"] = stage_name(record.stage);

    boost::json::object query;
    query["original"] = record.query;
    query["length"] = record.query.size();
    out["query"] = std::move(query);

    boost::json::array documents;
    for (const auto& doc : record.documents) {
        documents.push_back(document_json(doc));
    }
    boost::json::object documents_block;
    documents_block["count"] = record.documents.size();
    documents_block["documents"] = std::move(documents);
    out["documents"] = std::move(documents_block);

    if (record.prompt) {
        boost::json::object prompt;
        prompt["length"] = record.prompt->size();
        prompt["full_prompt"] = *record.prompt;
        out["prompt"] = std::move(prompt);
    } else {
        out["prompt"] = nullptr;
    }

    if (record.response) {
        boost::json::object response;
        response["text"] = *record.response;
        response["length"] = record.response->size();
        response["sources_count"] = record.sources.size();
        out["response"] = std::move(response);
    } else {
        out["response"] = nullptr;
    }

    boost::json::array sources;
    for (const auto& citation : record.sources) {
        sources.push_back(citation_json(citation));
    }
    out["sources"] = std::move(sources);
    out["metadata"] = record.metadata;

    if (record.error) {
        boost::json::object error;
        error["kind"] = error_code_name(record.error->kind);
        error["message"] = record.error->message;
        error["retryable"] = record.error->retryable();
        if (record.error->generation_kind) {
            error["generation_kind"] = generation_error_kind_name(*record.error->generation_kind);
        }
        out["error"] = std::move(error);
    } else {
        out["error"] = nullptr;
    }
    return out;
}

boost::json::object to_json(const IngestionRecord& record) {
    boost::json::object out;
    out["timestamp"] = iso_timestamp(record.timestamp);
    out["type"] = "ingestion";
    out["file_path"] = record.file_path;
    out["document_id"] = record.document_id;
    out["chunks_created"] = record.chunks_created;
    out["collection"] = record.collection;

    boost::json::object metadata;
    for (const auto& name : DocumentMetadata::field_names()) {
        if (const auto value = record.metadata.field(name)) {
            metadata[name] = *value;
        }
    }
    out["metadata"] = std::move(metadata);
    return out;
}

JsonlAuditLog::JsonlAuditLog(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

std::filesystem::path JsonlAuditLog::file_for(std::chrono::system_clock::time_point timestamp) const {
    return directory_ / ("queries_" + format_time(timestamp, "%Y%m%d") + ".jsonl");
}

void JsonlAuditLog::record(const AuditRecord& record) {
    append_line(file_for(record.timestamp), boost::json::serialize(to_json(record)), "JsonlAuditLog::record");
    LOG_DEBUG("Audit record " + record.log_id + " written");
}

void JsonlAuditLog::record_ingestion(const IngestionRecord& record) {
    append_line(ingestion_file(), boost::json::serialize(to_json(record)), "JsonlAuditLog::record_ingestion");
    LOG_INFO("Ingestion recorded: " + record.file_path + " -> " + std::to_string(record.chunks_created) +
             " chunks in " + record.collection);
}

void JsonlAuditLog::append_line(const std::filesystem::path& path, const std::string& line, const char* context) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw IOError("cannot create audit directory " + directory_.string() + ": " + ec.message(), context);
    }

    std::ofstream out(path, std::ios::app | std::ios::binary);
    if (!out) {
        throw IOError("cannot open audit log " + path.string(), context);
    }
    out << line << '\n';
    out.flush();
    if (!out) {
        throw IOError("failed writing audit log " + path.string(), context);
    }
}

} // namespace pipeline
} // namespace crimrag
