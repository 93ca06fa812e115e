#include "crimrag/pipeline/citation_formatter.hpp"
#include "crimrag/error.hpp"

#include <unordered_map>

namespace crimrag {
namespace pipeline {

std::vector<Citation> CitationFormatter::collect_citations(const std::vector<RetrievedDocument>& documents) {
    std::vector<Citation> citations;
    std::unordered_map<std::string, std::size_t> by_source;

    for (const auto& doc : documents) {
        const std::string& name = doc.source_name();
        auto it = by_source.find(name);
        if (it == by_source.end()) {
            Citation citation;
            citation.number = citations.size() + 1;
            citation.document_name = name.empty() ? "unknown" : name;
            if (!doc.metadata.document_authority.empty()) {
                citation.authority = doc.metadata.document_authority;
            }
            citation.reliability = doc.metadata.source_reliability;
            citation.year = doc.metadata.publication_year;
            if (!doc.metadata.crime_type.empty()) {
                citation.crime_type = doc.metadata.crime_type;
            }
            it = by_source.emplace(name, citations.size()).first;
            citations.push_back(std::move(citation));
        }
        if (doc.chunk) {
            citations[it->second].chunk_ids.push_back(doc.chunk->id);
        }
    }

    return citations;
}

std::string CitationFormatter::render_citation(const Citation& citation) {
    std::string line = "[" + std::to_string(citation.number) + "] " + citation.document_name;
    if (citation.authority) {
        line += " (" + *citation.authority + ")";
    }
    if (citation.reliability) {
        line += std::string(" - reliability: ") + reliability_name(*citation.reliability);
    }
    if (citation.year) {
        line += " - " + std::to_string(*citation.year);
    }
    if (citation.crime_type) {
        line += " - crime type: " + *citation.crime_type;
    }
    return line;
}

FormattedResponse CitationFormatter::format(const std::string& response_text,
                                            const std::vector<RetrievedDocument>& documents) const {
    if (response_text.find('\0') != std::string::npos) {
        throw FormatError("response contains NUL bytes", "CitationFormatter::format");
    }
    if (response_text.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw FormatError("response is empty", "CitationFormatter::format");
    }

    FormattedResponse formatted;
    formatted.citations = collect_citations(documents);
    formatted.text = response_text;

    if (!formatted.citations.empty()) {
        formatted.text += "\n\n---\n\nSources:\n";
        for (std::size_t i = 0; i < formatted.citations.size(); ++i) {
            if (i > 0) {
                formatted.text += "\n";
            }
            formatted.text += render_citation(formatted.citations[i]);
        }
    }
    return formatted;
}

} // namespace pipeline
} // namespace crimrag
