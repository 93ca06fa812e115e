#include "crimrag/types.hpp"

#include <algorithm>
#include <cctype>

namespace crimrag {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<std::string> non_empty(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

const char* content_type_name(ContentType type) noexcept {
    switch (type) {
        case ContentType::THEORY: return "Theory";
        case ContentType::FACTS: return "Facts";
        case ContentType::ANALYSIS: return "Analysis";
        case ContentType::CONCLUSION: return "Conclusion";
        case ContentType::UNCLASSIFIED: return "Unclassified";
    }
    return "Unclassified";
}

std::optional<ContentType> parse_content_type(std::string_view name) {
    const std::string lower = lowercase(name);
    if (lower == "theory") return ContentType::THEORY;
    if (lower == "facts") return ContentType::FACTS;
    if (lower == "analysis") return ContentType::ANALYSIS;
    if (lower == "conclusion") return ContentType::CONCLUSION;
    if (lower == "unclassified") return ContentType::UNCLASSIFIED;
    return std::nullopt;
}

const char* reliability_name(SourceReliability reliability) noexcept {
    switch (reliability) {
        case SourceReliability::HIGH: return "high";
        case SourceReliability::MEDIUM: return "medium";
        case SourceReliability::LOW: return "low";
    }
    return "low";
}

std::optional<SourceReliability> parse_reliability(std::string_view name) {
    const std::string lower = lowercase(name);
    if (lower == "high" || lower == "alta") return SourceReliability::HIGH;
    if (lower == "medium" || lower == "media") return SourceReliability::MEDIUM;
    if (lower == "low" || lower == "baja") return SourceReliability::LOW;
    return std::nullopt;
}

std::string make_chunk_id(const std::string& document_id, std::size_t index) {
    return document_id + "_chunk_" + std::to_string(index);
}

const std::vector<std::string>& DocumentMetadata::field_names() {
    static const std::vector<std::string> names = {
        "source", "crime_type", "offender_type", "victimology",
        "modus_operandi", "signature_behavior", "geography", "time_period",
        "source_reliability", "document_authority", "publication_year"
    };
    return names;
}

std::optional<std::string> DocumentMetadata::field(std::string_view name) const {
    if (name == "source") return non_empty(source);
    if (name == "crime_type") return non_empty(crime_type);
    if (name == "offender_type") return non_empty(offender_type);
    if (name == "victimology") return non_empty(victimology);
    if (name == "modus_operandi") return non_empty(modus_operandi);
    if (name == "signature_behavior") return non_empty(signature_behavior);
    if (name == "geography") return non_empty(geography);
    if (name == "time_period") return non_empty(time_period);
    if (name == "document_authority") return non_empty(document_authority);
    if (name == "source_reliability") {
        if (!source_reliability) return std::nullopt;
        return std::string(reliability_name(*source_reliability));
    }
    if (name == "publication_year") {
        if (!publication_year) return std::nullopt;
        return std::to_string(*publication_year);
    }
    return std::nullopt;
}

const std::string& RetrievedDocument::source_name() const {
    if (!metadata.source.empty() || !chunk) {
        return metadata.source;
    }
    return chunk->source_document_id;
}

} // namespace crimrag
