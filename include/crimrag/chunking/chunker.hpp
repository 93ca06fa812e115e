#pragma once

#include "crimrag/chunking/content_classifier.hpp"
#include "crimrag/chunking/tokenizer.hpp"
#include "crimrag/config.hpp"
#include "crimrag/types.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace crimrag {
namespace chunking {

struct ChunkerParams {
    std::size_t target_tokens = 650;
    double overlap_ratio = 0.15;
    double boundary_tolerance = 0.20;

    std::size_t overlap_tokens() const;
    std::size_t min_tokens() const;
    std::size_t max_tokens() const;
};

/**
 * Lazy, restartable sequence of chunks over one document.
 *
 * The document is tokenized once when the sequence is built; chunks are cut
 * one at a time while iterating. Copies share the tokenized document.
 */
class ChunkSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Chunk;
        using difference_type = std::ptrdiff_t;
        using pointer = const Chunk*;
        using reference = const Chunk&;

        iterator() = default;

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++();
        iterator operator++(int);

        bool operator==(const iterator& other) const;
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class ChunkSequence;
        explicit iterator(const ChunkSequence* sequence);

        void advance();

        const ChunkSequence* sequence_ = nullptr;
        std::size_t next_start_ = 0;
        std::size_t next_index_ = 0;
        std::string section_;
        std::optional<Chunk> current_;
    };

    iterator begin() const { return iterator(this); }
    iterator end() const { return iterator(); }

    std::vector<Chunk> to_vector() const;

    std::size_t token_count() const;
    const std::string& document_id() const;
    const std::string& text() const;
    const ChunkerParams& params() const;

private:
    friend class Chunker;

    struct Document {
        std::string document_id;
        std::string text;
        std::vector<Token> tokens;
        ChunkerParams params;
        std::shared_ptr<const ContentClassifier> classifier;
    };

    explicit ChunkSequence(std::shared_ptr<const Document> document);

    // Exclusive end token of the chunk starting at `start`.
    std::size_t find_cut(std::size_t start) const;

    std::shared_ptr<const Document> document_;
};

/**
 * Splits document text into overlapping, token-bounded chunks tagged with a
 * content type and section heading.
 */
class Chunker {
public:
    Chunker();
    explicit Chunker(const ChunkingConfig& config,
                     std::shared_ptr<const ContentClassifier> classifier = nullptr);

    // Throws InputError on empty/whitespace-only text or out-of-range params.
    ChunkSequence chunk(const std::string& document_id, std::string text) const;
    ChunkSequence chunk(const std::string& document_id, std::string text,
                        std::size_t target_tokens, double overlap_ratio) const;

    const ChunkerParams& params() const { return params_; }

private:
    static void validate(const ChunkerParams& params);

    ChunkerParams params_;
    std::shared_ptr<const ContentClassifier> classifier_;
};

} // namespace chunking
} // namespace crimrag
