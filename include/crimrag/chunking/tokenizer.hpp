#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace crimrag {
namespace chunking {

/**
 * A maximal run of non-whitespace bytes. [begin, end) are byte offsets into
 * the tokenized text.
 */
struct Token {
    std::size_t begin = 0;
    std::size_t end = 0;
    bool paragraph_break_before = false;    // blank line between this token and the previous one
    bool ends_sentence = false;             // ends in . ! ? (optionally followed by a closing quote/bracket)
};

std::vector<Token> tokenize(std::string_view text);

std::size_t count_tokens(std::string_view text);

// Returns the prefix of `text` holding at most `max_tokens` tokens, cut at a
// token end so no token is split.
std::string_view truncate_to_tokens(std::string_view text, std::size_t max_tokens);

inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace chunking
} // namespace crimrag
