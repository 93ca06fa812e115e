#pragma once

#include <string>

namespace crimrag {
namespace generation {
namespace prompts {

enum class QueryType {
    GENERAL,
    THEORY,
    CASE_STUDY,
    TECHNIQUE,
    FORENSIC
};

const char* query_type_name(QueryType type) noexcept;

// First matching family wins: theory, case study, technique, forensic.
QueryType classify_query_type(const std::string& query);

const std::string& system_prompt();

// Used in place of the context when no document was retrieved.
const std::string& empty_context_text();

// Answer returned without calling the model when retrieval found nothing.
const std::string& insufficient_evidence_message();

std::string format_prompt_with_context(const std::string& query,
                                       const std::string& context,
                                       QueryType type = QueryType::GENERAL);

} // namespace prompts
} // namespace generation
} // namespace crimrag
