#include "crimrag/chunking/content_classifier.hpp"
#include "crimrag/chunking/tokenizer.hpp"

#include <cctype>

namespace crimrag {
namespace chunking {

namespace {

bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c >= 0x80;
}

std::string_view strip(std::string_view line) {
    while (!line.empty() && is_space(line.front())) line.remove_prefix(1);
    while (!line.empty() && is_space(line.back())) line.remove_suffix(1);
    return line;
}

// At least two cased letters and no lowercase ASCII letter.
bool is_all_caps(std::string_view line) {
    std::size_t letters = 0;
    for (unsigned char c : line) {
        if (std::islower(c)) {
            return false;
        }
        if (std::isupper(c)) {
            ++letters;
        }
    }
    return letters >= 2;
}

// Every word is one capital followed by one or more lowercase letters.
bool is_title_case(std::string_view line) {
    std::size_t pos = 0;
    std::size_t words = 0;
    while (pos < line.size()) {
        if (!std::isupper(static_cast<unsigned char>(line[pos]))) {
            return false;
        }
        ++pos;
        std::size_t lower = 0;
        while (pos < line.size() && std::islower(static_cast<unsigned char>(line[pos]))) {
            ++pos;
            ++lower;
        }
        if (lower == 0) {
            return false;
        }
        ++words;
        if (pos == line.size()) {
            break;
        }
        if (!is_space(line[pos])) {
            return false;
        }
        while (pos < line.size() && is_space(line[pos])) {
            ++pos;
        }
    }
    return words > 0;
}

// "3 Method", "1.2 Scope", "4. Results"
bool is_numbered_heading(std::string_view line) {
    std::size_t pos = 0;
    if (pos >= line.size() || !std::isdigit(static_cast<unsigned char>(line[pos]))) {
        return false;
    }
    while (pos < line.size() &&
           (std::isdigit(static_cast<unsigned char>(line[pos])) || line[pos] == '.')) {
        ++pos;
    }
    if (pos >= line.size() || !is_space(line[pos])) {
        return false;
    }
    while (pos < line.size() && is_space(line[pos])) {
        ++pos;
    }
    return pos < line.size() && std::isupper(static_cast<unsigned char>(line[pos]));
}

} // namespace

KeywordContentClassifier::KeywordContentClassifier()
    : keyword_sets_{
          {ContentType::THEORY,
           {"theory", "theories", "theoretical", "model", "models", "framework",
            "teoría", "teorías", "teórico", "modelo", "modelos"}},
          {ContentType::FACTS,
           {"fact", "facts", "evidence", "occurred", "happened", "recovered",
            "hecho", "hechos", "evidencia", "ocurrió", "sucedió"}},
          {ContentType::ANALYSIS,
           {"analysis", "analyze", "analyse", "examine", "examined", "evaluate",
            "evaluation", "assessment", "análisis", "analizar", "examinar", "evaluar"}},
          {ContentType::CONCLUSION,
           {"conclusion", "conclusions", "conclude", "summary",
            "conclusión", "conclusiones", "resumen"}},
      } {}

std::string KeywordContentClassifier::normalize(std::string_view text) {
    // Lowercased words separated by single spaces, padded on both ends so
    // " keyword " matches whole words only.
    std::string out = " ";
    bool pending_space = false;
    for (unsigned char c : text) {
        if (is_word_byte(c)) {
            if (pending_space) {
                out.push_back(' ');
                pending_space = false;
            }
            out.push_back(static_cast<char>(std::tolower(c)));
        } else if (out.size() > 1) {
            pending_space = true;
        }
    }
    out.push_back(' ');
    return out;
}

std::size_t KeywordContentClassifier::count_hits_normalized(const std::string& normalized,
                                                            const KeywordSet& set) const {
    std::size_t hits = 0;
    for (const auto& keyword : set.keywords) {
        const std::string needle = " " + keyword + " ";
        std::size_t pos = normalized.find(needle);
        while (pos != std::string::npos) {
            ++hits;
            pos = normalized.find(needle, pos + 1);
        }
    }
    return hits;
}

std::size_t KeywordContentClassifier::count_hits(std::string_view text, ContentType type) const {
    const std::string normalized = normalize(text);
    for (const auto& set : keyword_sets_) {
        if (set.type == type) {
            return count_hits_normalized(normalized, set);
        }
    }
    return 0;
}

Classification KeywordContentClassifier::classify(std::string_view text) const {
    const std::string normalized = normalize(text);

    Classification result;
    std::size_t best = 0;
    std::size_t total = 0;
    // keyword_sets_ is in tie-break order, so a strict > keeps the earlier type
    for (const auto& set : keyword_sets_) {
        const std::size_t hits = count_hits_normalized(normalized, set);
        total += hits;
        if (hits > best) {
            best = hits;
            result.type = set.type;
        }
    }

    if (total > 0) {
        result.confidence = static_cast<float>(best) / static_cast<float>(total);
    }
    return result;
}

std::string detect_section_heading(std::string_view text) {
    std::size_t pos = 0;
    for (int line_no = 0; line_no < 3 && pos <= text.size(); ++line_no) {
        const auto newline = text.find('\n', pos);
        const auto end = newline == std::string_view::npos ? text.size() : newline;
        const std::string_view line = strip(text.substr(pos, end - pos));

        if (!line.empty() && line.size() < 100 &&
            (is_all_caps(line) || is_title_case(line) || is_numbered_heading(line))) {
            return std::string(line);
        }
        if (newline == std::string_view::npos) {
            break;
        }
        pos = newline + 1;
    }
    return "";
}

} // namespace chunking
} // namespace crimrag
