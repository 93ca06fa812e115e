#pragma once

#include "crimrag/chunking/chunker.hpp"
#include "crimrag/index/index_adapter.hpp"
#include "crimrag/pipeline/audit_log.hpp"
#include "crimrag/types.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace crimrag {
namespace ingest {

struct SourceDocument {
    std::string document_id;
    std::string text;
    DocumentMetadata metadata;
    std::filesystem::path path;
};

/**
 * Reads a normalized text document. Metadata comes from an optional YAML
 * sidecar named <file>.meta.yaml; `source` defaults to the file name and
 * the document id to the file stem. Throws IOError / ConfigError.
 */
SourceDocument load_document(const std::filesystem::path& path);

// Every *.txt and *.md file directly inside `directory`, sorted by name.
std::vector<SourceDocument> load_corpus(const std::filesystem::path& directory);

DocumentMetadata load_metadata_file(const std::filesystem::path& path);

/**
 * Chunks documents and upserts them into an index adapter in batches.
 * With an audit sink, every ingested document leaves an ingestion record
 * naming `collection`; sink failures are logged only.
 */
class Ingestor {
public:
    Ingestor(std::shared_ptr<index::IndexAdapter> index,
             chunking::Chunker chunker,
             std::size_t batch_size = 64,
             std::shared_ptr<pipeline::AuditSink> audit = nullptr,
             std::string collection = "");

    // Returns the number of chunks written.
    std::size_t ingest(const SourceDocument& document, std::chrono::milliseconds timeout) const;

private:
    std::shared_ptr<index::IndexAdapter> index_;
    chunking::Chunker chunker_;
    std::size_t batch_size_;
    std::shared_ptr<pipeline::AuditSink> audit_;
    std::string collection_;
};

} // namespace ingest
} // namespace crimrag
