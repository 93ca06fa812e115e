#pragma once

#include "crimrag/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace crimrag {
namespace pipeline {

struct BuiltContext {
    std::string text;
    std::vector<RetrievedDocument> documents;   // the documents actually included
    std::size_t token_count = 0;
    bool truncated = false;                     // first document cut to fit
};

/**
 * Renders documents in rank order as
 *   [Document i - Source: name]\n<chunk text>
 * joined by "\n---\n\n". Whole documents are added while the running token
 * count stays within `max_tokens`; the rest are dropped. A first document
 * that alone exceeds the budget is cut at a token boundary.
 */
BuiltContext build_context(const std::vector<RetrievedDocument>& documents, std::size_t max_tokens);

} // namespace pipeline
} // namespace crimrag
