#include "crimrag/generation/prompts.hpp"

#include <algorithm>
#include <initializer_list>
#include <cctype>

namespace crimrag {
namespace generation {
namespace prompts {

namespace {

const char* const kUserTemplateHead = "Provided context (relevant documents):\n\n";
const char* const kUserTemplateQuestion = "\n\n---\n\nUser question: ";
const char* const kUserTemplateTail =
    "\n\nPlease give a complete, well-grounded answer based ONLY on the provided context. "
    "If the context does not contain enough information to answer fully, state that limitation clearly.";

bool contains_any(const std::string& haystack, const std::initializer_list<const char*>& needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&](const char* needle) { return haystack.find(needle) != std::string::npos; });
}

} // namespace

const char* query_type_name(QueryType type) noexcept {
    switch (type) {
        case QueryType::GENERAL: return "general";
        case QueryType::THEORY: return "theory";
        case QueryType::CASE_STUDY: return "case_study";
        case QueryType::TECHNIQUE: return "technique";
        case QueryType::FORENSIC: return "forensic";
    }
    return "general";
}

QueryType classify_query_type(const std::string& query) {
    std::string lower = query;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (contains_any(lower, {"theory", "teoría", "model", "modelo", "framework", "marco conceptual"})) {
        return QueryType::THEORY;
    }
    if (contains_any(lower, {"case", "caso", "example", "ejemplo", "estudio de caso"})) {
        return QueryType::CASE_STUDY;
    }
    if (contains_any(lower, {"technique", "técnica", "method", "método", "procedure", "procedimiento", "process", "proceso"})) {
        return QueryType::TECHNIQUE;
    }
    if (contains_any(lower, {"forensic", "forense", "evidence", "evidencia", "ballistic", "balística"})) {
        return QueryType::FORENSIC;
    }
    return QueryType::GENERAL;
}

const std::string& system_prompt() {
    static const std::string prompt =
        "You are a senior criminological analyst with expertise in:\n"
        "- General criminology and criminological theory\n"
        "- Forensic medicine and crime scene analysis\n"
        "- Forensic ballistics\n"
        "- Criminal psychology\n"
        "- Modus operandi (MO) and signature behavior\n"
        "- Criminal profiling\n"
        "- Criminal investigation techniques\n"
        "\n"
        "CRITICAL RULES:\n"
        "1. Answer ONLY from the documents provided in the context.\n"
        "2. NEVER invent data, statistics, cases or information that is not in the context.\n"
        "3. ALWAYS cite sources explicitly when you use specific information.\n"
        "4. Clearly distinguish between documented facts, analysis and inference, and theories and models.\n"
        "5. If the context is not sufficient, state that limitation clearly.\n"
        "6. Use precise technical language that stays accessible.\n"
        "7. Structure answers clearly.\n"
        "\n"
        "LEGAL AND ETHICAL NOTICE:\n"
        "- This system is a research and academic analysis tool.\n"
        "- It must NOT be used to profile real, contemporary individuals.\n"
        "- It must NOT be used to draw accusatory inferences about specific people.\n"
        "- Information is provided for educational and research purposes only.\n"
        "\n"
        "RESPONSE FORMAT:\n"
        "- Give structured, well-organized answers.\n"
        "- Include explicit citations to the sources you rely on.\n"
        "- State your level of certainty where appropriate (High/Medium/Low).\n"
        "- When you mention specific cases, include the relevant context.";
    return prompt;
}

const std::string& empty_context_text() {
    static const std::string text = "No relevant documents were found in the knowledge base.";
    return text;
}

const std::string& insufficient_evidence_message() {
    static const std::string message =
        "Insufficient evidence: no documents in the knowledge base matched this question, "
        "so no grounded answer can be given. Try rephrasing the question or relaxing the filters.";
    return message;
}

std::string format_prompt_with_context(const std::string& query, const std::string& context, QueryType type) {
    std::string prompt = kUserTemplateHead;
    prompt += context.empty() ? empty_context_text() : context;
    prompt += kUserTemplateQuestion;
    prompt += query;
    prompt += kUserTemplateTail;

    switch (type) {
        case QueryType::THEORY:
            prompt += "\n\nFOCUS: This question calls for theoretical analysis. "
                      "Concentrate on models, theories and conceptual frameworks.";
            break;
        case QueryType::CASE_STUDY:
            prompt += "\n\nFOCUS: This question calls for case analysis. "
                      "Give contextual detail and documented evidence.";
            break;
        case QueryType::TECHNIQUE:
            prompt += "\n\nFOCUS: This question is about techniques and methodology. "
                      "Give steps, procedures and established practice.";
            break;
        case QueryType::FORENSIC:
            prompt += "\n\nFOCUS: This question calls for forensic analysis. "
                      "Concentrate on evidence, forensic methodology and scientific procedure.";
            break;
        case QueryType::GENERAL:
            break;
    }
    return prompt;
}

} // namespace prompts
} // namespace generation
} // namespace crimrag
