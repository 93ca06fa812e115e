#pragma once

#include "crimrag/pipeline/pipeline_state.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace crimrag {
namespace pipeline {

// Snapshot of one finished invocation.
struct AuditRecord {
    std::string log_id;
    std::chrono::system_clock::time_point timestamp;
    std::string query;
    Stage stage = Stage::START;
    std::vector<RetrievedDocument> documents;
    std::optional<std::string> prompt;
    std::optional<std::string> response;
    std::vector<Citation> sources;
    std::optional<PipelineError> error;
    boost::json::object metadata;
};

AuditRecord make_audit_record(const PipelineState& state,
                              std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now());

boost::json::object to_json(const AuditRecord& record);

// One ingested document.
struct IngestionRecord {
    std::chrono::system_clock::time_point timestamp;
    std::string file_path;
    std::string document_id;
    std::size_t chunks_created = 0;
    std::string collection;
    DocumentMetadata metadata;
};

boost::json::object to_json(const IngestionRecord& record);

class AuditSink {
public:
    virtual ~AuditSink() = default;

    // May throw; callers log and carry on.
    virtual void record(const AuditRecord& record) = 0;
    virtual void record_ingestion(const IngestionRecord& record) = 0;
};

/**
 * Appends one JSON object per line to <directory>/queries_YYYYMMDD.jsonl
 * (UTC date of the record). Ingestion records go to
 * <directory>/ingestion.jsonl. Thread-safe.
 */
class JsonlAuditLog : public AuditSink {
public:
    explicit JsonlAuditLog(std::filesystem::path directory);

    void record(const AuditRecord& record) override;
    void record_ingestion(const IngestionRecord& record) override;

    std::filesystem::path file_for(std::chrono::system_clock::time_point timestamp) const;
    std::filesystem::path ingestion_file() const { return directory_ / "ingestion.jsonl"; }

private:
    void append_line(const std::filesystem::path& path, const std::string& line, const char* context);

    std::filesystem::path directory_;
    std::mutex mutex_;
};

} // namespace pipeline
} // namespace crimrag
