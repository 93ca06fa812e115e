#include "crimrag/chunking/chunker.hpp"
#include "crimrag/error.hpp"

#include <algorithm>
#include <cmath>

namespace crimrag {
namespace chunking {

namespace {

constexpr double kRoundingSlack = 1e-9;

} // namespace

std::size_t ChunkerParams::overlap_tokens() const {
    return static_cast<std::size_t>(std::llround(overlap_ratio * static_cast<double>(target_tokens)));
}

std::size_t ChunkerParams::max_tokens() const {
    const auto upper = static_cast<std::size_t>(
        std::floor(static_cast<double>(target_tokens) * (1.0 + boundary_tolerance) + kRoundingSlack));
    return std::max(upper, target_tokens);
}

std::size_t ChunkerParams::min_tokens() const {
    auto lower = static_cast<std::size_t>(
        std::ceil(static_cast<double>(target_tokens) * (1.0 - boundary_tolerance) - kRoundingSlack));
    lower = std::max(lower, overlap_tokens() + 1);
    return std::min(lower, target_tokens);
}

// ChunkSequence

ChunkSequence::ChunkSequence(std::shared_ptr<const Document> document)
    : document_(std::move(document)) {}

std::size_t ChunkSequence::token_count() const {
    return document_->tokens.size();
}

const std::string& ChunkSequence::document_id() const {
    return document_->document_id;
}

const std::string& ChunkSequence::text() const {
    return document_->text;
}

const ChunkerParams& ChunkSequence::params() const {
    return document_->params;
}

std::vector<Chunk> ChunkSequence::to_vector() const {
    std::vector<Chunk> chunks;
    for (const auto& chunk : *this) {
        chunks.push_back(chunk);
    }
    return chunks;
}

std::size_t ChunkSequence::find_cut(std::size_t start) const {
    const auto& tokens = document_->tokens;
    const auto& params = document_->params;
    const std::size_t n = tokens.size();

    if (n - start <= params.max_tokens()) {
        return n;
    }

    const std::size_t lo = start + params.min_tokens();
    const std::size_t hi = start + params.max_tokens();
    const std::size_t ideal = start + params.target_tokens;

    auto distance = [ideal](std::size_t e) {
        return e > ideal ? e - ideal : ideal - e;
    };

    std::optional<std::size_t> paragraph_cut;
    std::optional<std::size_t> sentence_cut;
    for (std::size_t e = lo; e <= hi; ++e) {
        if (tokens[e].paragraph_break_before &&
            (!paragraph_cut || distance(e) < distance(*paragraph_cut))) {
            paragraph_cut = e;
        }
        if (tokens[e - 1].ends_sentence &&
            (!sentence_cut || distance(e) < distance(*sentence_cut))) {
            sentence_cut = e;
        }
    }

    if (paragraph_cut) {
        return *paragraph_cut;
    }
    if (sentence_cut) {
        return *sentence_cut;
    }
    return ideal;
}

// ChunkSequence::iterator

ChunkSequence::iterator::iterator(const ChunkSequence* sequence)
    : sequence_(sequence) {
    advance();
}

ChunkSequence::iterator& ChunkSequence::iterator::operator++() {
    advance();
    return *this;
}

ChunkSequence::iterator ChunkSequence::iterator::operator++(int) {
    iterator previous = *this;
    advance();
    return previous;
}

bool ChunkSequence::iterator::operator==(const iterator& other) const {
    if (sequence_ == nullptr || other.sequence_ == nullptr) {
        return sequence_ == other.sequence_;
    }
    return sequence_ == other.sequence_ && next_index_ == other.next_index_;
}

void ChunkSequence::iterator::advance() {
    if (sequence_ == nullptr) {
        return;
    }

    const Document& doc = *sequence_->document_;
    const std::size_t n = doc.tokens.size();
    if (next_start_ >= n) {
        sequence_ = nullptr;
        current_.reset();
        return;
    }

    const std::size_t start = next_start_;
    const std::size_t end = sequence_->find_cut(start);
    const std::size_t overlap = next_index_ == 0 ? 0 : doc.params.overlap_tokens();

    Chunk chunk;
    chunk.index = next_index_;
    chunk.id = make_chunk_id(doc.document_id, chunk.index);
    chunk.source_document_id = doc.document_id;
    chunk.start_offset = doc.tokens[start].begin;
    chunk.core_offset = doc.tokens[start + overlap].begin;
    chunk.end_offset = doc.tokens[end - 1].end;
    chunk.text = doc.text.substr(chunk.start_offset, chunk.end_offset - chunk.start_offset);
    chunk.token_count = end - start;
    chunk.overlap_ratio = doc.params.overlap_ratio;
    chunk.overlap_tokens = overlap;

    if (doc.classifier) {
        const Classification classification = doc.classifier->classify(chunk.text);
        chunk.content_type = classification.type;
        chunk.confidence_level = classification.confidence;
    }

    std::string heading = detect_section_heading(chunk.text);
    if (!heading.empty()) {
        section_ = std::move(heading);
    }
    chunk.section_id = section_;

    current_ = std::move(chunk);
    ++next_index_;
    next_start_ = end < n ? end - doc.params.overlap_tokens() : n;
}

// Chunker

Chunker::Chunker()
    : Chunker(ChunkingConfig{}) {}

Chunker::Chunker(const ChunkingConfig& config, std::shared_ptr<const ContentClassifier> classifier)
    : classifier_(classifier ? std::move(classifier) : std::make_shared<KeywordContentClassifier>()) {
    params_.target_tokens = config.target_tokens;
    params_.overlap_ratio = config.overlap_ratio;
    params_.boundary_tolerance = config.boundary_tolerance;
    validate(params_);
}

void Chunker::validate(const ChunkerParams& params) {
    CRIMRAG_CHECK_ARGUMENT(params.target_tokens > 0, "target_tokens must be positive");
    CRIMRAG_CHECK_ARGUMENT(params.overlap_ratio >= 0.0 && params.overlap_ratio < 0.5,
                           "overlap_ratio must be in [0, 0.5)");
    CRIMRAG_CHECK_ARGUMENT(params.boundary_tolerance >= 0.0 && params.boundary_tolerance < 1.0,
                           "boundary_tolerance must be in [0, 1)");
}

ChunkSequence Chunker::chunk(const std::string& document_id, std::string text) const {
    return chunk(document_id, std::move(text), params_.target_tokens, params_.overlap_ratio);
}

ChunkSequence Chunker::chunk(const std::string& document_id, std::string text,
                             std::size_t target_tokens, double overlap_ratio) const {
    ChunkerParams params = params_;
    params.target_tokens = target_tokens;
    params.overlap_ratio = overlap_ratio;
    validate(params);
    CRIMRAG_CHECK_ARGUMENT(!document_id.empty(), "document_id must not be empty");

    auto document = std::make_shared<ChunkSequence::Document>();
    document->document_id = document_id;
    document->text = std::move(text);
    document->tokens = tokenize(document->text);
    document->params = params;
    document->classifier = classifier_;

    CRIMRAG_CHECK_ARGUMENT(!document->tokens.empty(),
                           "document '" + document_id + "' is empty or whitespace-only");

    return ChunkSequence(std::move(document));
}

} // namespace chunking
} // namespace crimrag
