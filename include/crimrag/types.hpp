#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crimrag {

using Embedding = std::vector<float>;

enum class ContentType {
    THEORY,
    FACTS,
    ANALYSIS,
    CONCLUSION,
    UNCLASSIFIED
};

const char* content_type_name(ContentType type) noexcept;
std::optional<ContentType> parse_content_type(std::string_view name);

enum class SourceReliability {
    HIGH,
    MEDIUM,
    LOW
};

const char* reliability_name(SourceReliability reliability) noexcept;
// Accepts high/medium/low and alta/media/baja.
std::optional<SourceReliability> parse_reliability(std::string_view name);

/**
 * A contiguous span of one source document. Created once at ingestion and
 * never modified afterwards.
 *
 * Byte offsets index the source document: [start_offset, end_offset) is the
 * chunk text, [core_offset, end_offset) the part not shared with the
 * previous chunk.
 */
struct Chunk {
    std::string id;
    std::size_t index = 0;
    std::string text;
    std::size_t token_count = 0;
    double overlap_ratio = 0.0;
    std::size_t overlap_tokens = 0;
    ContentType content_type = ContentType::UNCLASSIFIED;
    std::string section_id;
    std::string source_document_id;
    float confidence_level = 0.0f;
    std::size_t start_offset = 0;
    std::size_t core_offset = 0;
    std::size_t end_offset = 0;
};

std::string make_chunk_id(const std::string& document_id, std::size_t index);

/**
 * Descriptive metadata attached to every chunk of a document. Empty strings
 * mean "not known".
 */
struct DocumentMetadata {
    std::string source;
    std::string crime_type;
    std::string offender_type;
    std::string victimology;
    std::string modus_operandi;
    std::string signature_behavior;
    std::string geography;
    std::string time_period;
    std::optional<SourceReliability> source_reliability;
    std::string document_authority;
    std::optional<int> publication_year;

    // String rendering of a filterable field; nullopt when unknown or absent.
    std::optional<std::string> field(std::string_view name) const;

    static const std::vector<std::string>& field_names();
};

struct RetrievedDocument {
    std::shared_ptr<const Chunk> chunk;
    DocumentMetadata metadata;
    float similarity_score = 0.0f;
    std::size_t rank = 0;
    std::string collection_name;
    std::optional<float> rerank_score;

    // Metadata source, falling back to the chunk's document id.
    const std::string& source_name() const;
};

struct Citation {
    std::size_t number = 0;
    std::string document_name;
    std::optional<std::string> authority;
    std::optional<SourceReliability> reliability;
    std::optional<int> year;
    std::optional<std::string> crime_type;
    std::vector<std::string> chunk_ids;
};

} // namespace crimrag
