#pragma once

#include "crimrag/types.hpp"

#include <string>
#include <vector>

namespace crimrag {
namespace pipeline {

struct FormattedResponse {
    std::string text;
    std::vector<Citation> citations;
};

/**
 * Appends a numbered source list to a generated answer.
 *
 * One citation per distinct source document, numbered from 1 in order of
 * first appearance. Output depends only on the inputs.
 */
class CitationFormatter {
public:
    // Throws FormatError on empty/whitespace-only text or embedded NUL bytes.
    FormattedResponse format(const std::string& response_text,
                             const std::vector<RetrievedDocument>& documents) const;

    static std::vector<Citation> collect_citations(const std::vector<RetrievedDocument>& documents);

    // "[n] name (authority) - reliability: r - year - crime type: c"
    static std::string render_citation(const Citation& citation);
};

} // namespace pipeline
} // namespace crimrag
