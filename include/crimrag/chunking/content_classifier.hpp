#pragma once

#include "crimrag/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace crimrag {
namespace chunking {

struct Classification {
    ContentType type = ContentType::UNCLASSIFIED;
    float confidence = 0.0f;
};

class ContentClassifier {
public:
    virtual ~ContentClassifier() = default;
    virtual Classification classify(std::string_view text) const = 0;
};

/**
 * Counts whole-word keyword hits per content type (English and Spanish).
 * The type with the most hits wins; ties go Theory, Facts, Analysis,
 * Conclusion. Confidence is best hits over total hits.
 */
class KeywordContentClassifier : public ContentClassifier {
public:
    KeywordContentClassifier();

    Classification classify(std::string_view text) const override;

    // Number of keyword hits for one type in `text`.
    std::size_t count_hits(std::string_view text, ContentType type) const;

private:
    struct KeywordSet {
        ContentType type;
        std::vector<std::string> keywords;
    };

    static std::string normalize(std::string_view text);
    std::size_t count_hits_normalized(const std::string& normalized, const KeywordSet& set) const;

    std::vector<KeywordSet> keyword_sets_;
};

// Heading-like line among the first three lines of `text`, or "" if none.
std::string detect_section_heading(std::string_view text);

} // namespace chunking
} // namespace crimrag
