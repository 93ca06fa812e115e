#include "crimrag/ingest/ingestor.hpp"
#include "crimrag/error.hpp"
#include "crimrag/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace crimrag {
namespace ingest {

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError("cannot open " + path.string(), "load_document");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::filesystem::path sidecar_for(const std::filesystem::path& path) {
    std::filesystem::path sidecar = path;
    sidecar += ".meta.yaml";
    return sidecar;
}

} // namespace

DocumentMetadata load_metadata_file(const std::filesystem::path& path) {
    DocumentMetadata metadata;
    try {
        const YAML::Node yaml = YAML::LoadFile(path.string());
        if (!yaml.IsMap()) {
            throw ConfigError("metadata file " + path.string() + " must be a mapping", "load_metadata_file");
        }

        auto read = [&yaml](const char* key, std::string& target) {
            if (yaml[key]) {
                target = yaml[key].as<std::string>();
            }
        };
        read("source", metadata.source);
        read("crime_type", metadata.crime_type);
        read("offender_type", metadata.offender_type);
        read("victimology", metadata.victimology);
        read("modus_operandi", metadata.modus_operandi);
        read("signature_behavior", metadata.signature_behavior);
        read("geography", metadata.geography);
        read("time_period", metadata.time_period);
        read("document_authority", metadata.document_authority);

        if (yaml["source_reliability"]) {
            const std::string raw = yaml["source_reliability"].as<std::string>();
            metadata.source_reliability = parse_reliability(raw);
            if (!metadata.source_reliability) {
                throw ConfigError("unknown source_reliability '" + raw + "' in " + path.string(),
                                  "load_metadata_file");
            }
        }
        if (yaml["publication_year"]) {
            metadata.publication_year = yaml["publication_year"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("invalid metadata file " + path.string() + ": " + e.what(), "load_metadata_file");
    }
    return metadata;
}

SourceDocument load_document(const std::filesystem::path& path) {
    SourceDocument document;
    document.path = path;
    document.document_id = path.stem().string();
    document.text = read_file(path);

    const auto sidecar = sidecar_for(path);
    std::error_code ec;
    if (std::filesystem::exists(sidecar, ec)) {
        document.metadata = load_metadata_file(sidecar);
    }
    if (document.metadata.source.empty()) {
        document.metadata.source = path.filename().string();
    }
    return document;
}

std::vector<SourceDocument> load_corpus(const std::filesystem::path& directory) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw IOError("corpus directory " + directory.string() + " does not exist", "load_corpus");
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(directory)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const auto extension = entry.path().extension();
        if (extension == ".txt" || extension == ".md") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<SourceDocument> documents;
    documents.reserve(files.size());
    for (const auto& file : files) {
        documents.push_back(load_document(file));
    }
    LOG_INFO("Loaded " + std::to_string(documents.size()) + " documents from " + directory.string());
    return documents;
}

Ingestor::Ingestor(std::shared_ptr<index::IndexAdapter> index,
                   chunking::Chunker chunker,
                   std::size_t batch_size,
                   std::shared_ptr<pipeline::AuditSink> audit,
                   std::string collection)
    : index_(std::move(index)),
      chunker_(std::move(chunker)),
      batch_size_(batch_size),
      audit_(std::move(audit)),
      collection_(std::move(collection)) {
    CRIMRAG_CHECK_ARGUMENT(index_ != nullptr, "Ingestor needs an index adapter");
    CRIMRAG_CHECK_ARGUMENT(batch_size_ > 0, "batch_size must be positive");
}

std::size_t Ingestor::ingest(const SourceDocument& document, std::chrono::milliseconds timeout) const {
    std::vector<index::IndexedChunk> batch;
    batch.reserve(batch_size_);
    std::size_t written = 0;

    for (const auto& chunk : chunker_.chunk(document.document_id, document.text)) {
        batch.push_back({chunk, document.metadata});
        if (batch.size() == batch_size_) {
            index_->upsert(batch, timeout);
            written += batch.size();
            batch.clear();
        }
    }
    if (!batch.empty()) {
        index_->upsert(batch, timeout);
        written += batch.size();
    }

    LOG_INFO("Ingested " + document.document_id + ": " + std::to_string(written) + " chunks");

    if (audit_) {
        pipeline::IngestionRecord record;
        record.timestamp = std::chrono::system_clock::now();
        record.file_path = document.path.empty() ? document.document_id : document.path.string();
        record.document_id = document.document_id;
        record.chunks_created = written;
        record.collection = collection_;
        record.metadata = document.metadata;
        try {
            audit_->record_ingestion(record);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to write ingestion record for " + document.document_id + ": " + e.what());
        }
    }
    return written;
}

} // namespace ingest
} // namespace crimrag
