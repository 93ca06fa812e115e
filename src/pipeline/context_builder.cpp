#include "crimrag/pipeline/context_builder.hpp"
#include "crimrag/chunking/tokenizer.hpp"

namespace crimrag {
namespace pipeline {

namespace {

const char* const kSeparator = "\n---\n\n";

std::string block_header(std::size_t position, const RetrievedDocument& doc) {
    const std::string& name = doc.source_name();
    return "[Document " + std::to_string(position) + " - Source: " + (name.empty() ? "unknown" : name) + "]\n";
}

} // namespace

BuiltContext build_context(const std::vector<RetrievedDocument>& documents, std::size_t max_tokens) {
    BuiltContext context;

    for (const auto& doc : documents) {
        if (!doc.chunk) {
            continue;
        }

        const std::string header = block_header(context.documents.size() + 1, doc);
        const std::size_t header_tokens = chunking::count_tokens(header);
        const std::size_t text_tokens = chunking::count_tokens(doc.chunk->text);
        const std::size_t block_tokens = header_tokens + text_tokens;

        if (context.token_count + block_tokens <= max_tokens) {
            if (!context.text.empty()) {
                context.text += kSeparator;
            }
            context.text += header;
            context.text += doc.chunk->text;
            context.token_count += block_tokens;
            context.documents.push_back(doc);
            continue;
        }

        if (context.documents.empty() && max_tokens > header_tokens) {
            const std::size_t budget = max_tokens - header_tokens;
            context.text = header + std::string(chunking::truncate_to_tokens(doc.chunk->text, budget));
            context.token_count = header_tokens + budget;
            context.truncated = true;
            context.documents.push_back(doc);
        }
        break;
    }

    return context;
}

} // namespace pipeline
} // namespace crimrag
