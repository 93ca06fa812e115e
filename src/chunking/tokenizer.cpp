#include "crimrag/chunking/tokenizer.hpp"

namespace crimrag {
namespace chunking {

namespace {

bool is_closing_mark(char c) {
    return c == '"' || c == '\'' || c == ')' || c == ']';
}

bool is_terminal_punctuation(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool token_ends_sentence(std::string_view text, std::size_t begin, std::size_t end) {
    std::size_t pos = end;
    while (pos > begin && is_closing_mark(text[pos - 1])) {
        --pos;
    }
    return pos > begin && is_terminal_punctuation(text[pos - 1]);
}

} // namespace

std::vector<Token> tokenize(std::string_view text) {
    std::vector<Token> tokens;
    std::size_t pos = 0;
    const std::size_t n = text.size();

    while (pos < n) {
        std::size_t newlines = 0;
        while (pos < n && is_space(text[pos])) {
            if (text[pos] == '\n') {
                ++newlines;
            }
            ++pos;
        }
        if (pos >= n) {
            break;
        }

        Token token;
        token.begin = pos;
        while (pos < n && !is_space(text[pos])) {
            ++pos;
        }
        token.end = pos;
        token.paragraph_break_before = !tokens.empty() && newlines >= 2;
        token.ends_sentence = token_ends_sentence(text, token.begin, token.end);
        tokens.push_back(token);
    }

    return tokens;
}

std::size_t count_tokens(std::string_view text) {
    std::size_t count = 0;
    bool in_token = false;
    for (char c : text) {
        if (is_space(c)) {
            in_token = false;
        } else if (!in_token) {
            in_token = true;
            ++count;
        }
    }
    return count;
}

std::string_view truncate_to_tokens(std::string_view text, std::size_t max_tokens) {
    std::size_t count = 0;
    bool in_token = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (is_space(text[i])) {
            if (in_token && count == max_tokens) {
                return text.substr(0, i);
            }
            in_token = false;
        } else if (!in_token) {
            if (count == max_tokens) {
                return text.substr(0, i);
            }
            in_token = true;
            ++count;
        }
    }
    return text;
}

} // namespace chunking
} // namespace crimrag
