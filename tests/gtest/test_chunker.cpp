// =============================================================================
// Chunker Tests
// =============================================================================

#include <gtest/gtest.h>
#include "crimrag/chunking/chunker.hpp"
#include "crimrag/chunking/content_classifier.hpp"
#include "crimrag/chunking/tokenizer.hpp"
#include "crimrag/error.hpp"

#include <set>
#include <string>
#include <vector>

using namespace crimrag;
using namespace crimrag::chunking;

namespace {

// "w0 w1 ... w{n-1}" with a period after every index in `sentence_ends` and
// a blank line before every index in `paragraph_before`.
std::string make_text(std::size_t n,
                      const std::set<std::size_t>& sentence_ends = {},
                      const std::set<std::size_t>& paragraph_before = {}) {
    std::string text;
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) {
            text += paragraph_before.count(i) ? "\n\n" : " ";
        }
        text += "w" + std::to_string(i);
        if (sentence_ends.count(i)) {
            text += ".";
        }
    }
    return text;
}

std::vector<std::string> token_strings(const std::string& text) {
    std::vector<std::string> out;
    for (const auto& token : tokenize(text)) {
        out.push_back(text.substr(token.begin, token.end - token.begin));
    }
    return out;
}

ChunkingConfig small_config(double overlap_ratio = 0.15) {
    ChunkingConfig config;
    config.target_tokens = 20;
    config.overlap_ratio = overlap_ratio;
    config.boundary_tolerance = 0.20;
    return config;
}

class FixedClassifier : public ContentClassifier {
public:
    Classification classify(std::string_view) const override {
        return {ContentType::FACTS, 0.75f};
    }
};

} // namespace

class ChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    Chunker chunker_{small_config()};
};

// Window for target 20, ratio 0.15, tolerance 0.2
TEST_F(ChunkerTest, ParamsDeriveWindow) {
    const ChunkerParams& params = chunker_.params();
    EXPECT_EQ(params.overlap_tokens(), 3u);
    EXPECT_EQ(params.min_tokens(), 16u);
    EXPECT_EQ(params.max_tokens(), 24u);

    ChunkerParams defaults;
    EXPECT_EQ(defaults.overlap_tokens(), 98u);   // round(0.15 * 650)
    EXPECT_EQ(defaults.min_tokens(), 520u);
    EXPECT_EQ(defaults.max_tokens(), 780u);
}

TEST_F(ChunkerTest, ShortDocumentIsSingleChunk) {
    const std::string text = make_text(10);
    const auto chunks = chunker_.chunk("doc", text).to_vector();

    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].id, "doc_chunk_0");
    EXPECT_EQ(chunks[0].index, 0u);
    EXPECT_EQ(chunks[0].token_count, 10u);
    EXPECT_EQ(chunks[0].overlap_tokens, 0u);
    EXPECT_EQ(chunks[0].start_offset, 0u);
    EXPECT_EQ(chunks[0].core_offset, 0u);
    EXPECT_EQ(chunks[0].end_offset, text.size());
    EXPECT_EQ(chunks[0].text, text);
    EXPECT_EQ(chunks[0].source_document_id, "doc");
}

TEST_F(ChunkerTest, HardCutAtTargetWithoutBoundaries) {
    const auto chunks = chunker_.chunk("doc", make_text(60)).to_vector();

    std::vector<std::size_t> counts;
    for (const auto& chunk : chunks) {
        counts.push_back(chunk.token_count);
    }
    EXPECT_EQ(counts, (std::vector<std::size_t>{20, 20, 20, 9}));
}

TEST_F(ChunkerTest, ParagraphBoundaryBeatsSentenceBoundary) {
    // Paragraph break before token 18, sentence end exactly at the target.
    const std::string text = make_text(60, {19}, {18});
    const auto chunks = chunker_.chunk("doc", text).to_vector();

    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].token_count, 18u);
    EXPECT_EQ(token_strings(chunks[1].text).front(), "w15");
}

TEST_F(ChunkerTest, SentenceBoundaryClosestToTarget) {
    // Sentence cuts give chunks of 18 tokens (two from target) or 23 (three from target).
    const auto chunks = chunker_.chunk("doc", make_text(60, {17, 22})).to_vector();
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].token_count, 18u);
}

TEST_F(ChunkerTest, SentenceBoundaryTiePrefersEarlierCut) {
    // Sentence cuts give chunks of 18 or 22 tokens, both two from the target.
    const auto chunks = chunker_.chunk("doc", make_text(60, {17, 21})).to_vector();
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].token_count, 18u);
}

TEST_F(ChunkerTest, BoundariesOutsideWindowAreIgnored) {
    // Sentence cuts give chunks of 10 or 30 tokens, both outside [16, 24].
    const auto chunks = chunker_.chunk("doc", make_text(60, {9, 29})).to_vector();
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0].token_count, 20u);
}

TEST_F(ChunkerTest, CoresTileDocumentWithoutGaps) {
    std::set<std::size_t> sentences;
    std::set<std::size_t> paragraphs;
    for (std::size_t i = 6; i < 300; i += 7) sentences.insert(i);
    for (std::size_t i = 30; i < 300; i += 31) paragraphs.insert(i);
    const std::string text = make_text(300, sentences, paragraphs);

    const auto chunks = chunker_.chunk("doc", text).to_vector();
    ASSERT_GT(chunks.size(), 5u);

    std::size_t core_tokens = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        core_tokens += chunks[i].token_count - chunks[i].overlap_tokens;
        if (i == 0) {
            EXPECT_EQ(chunks[i].core_offset, 0u);
            continue;
        }
        // Only whitespace separates the previous chunk from this chunk's core.
        const auto& prev = chunks[i - 1];
        ASSERT_LE(prev.end_offset, chunks[i].core_offset);
        const std::string gap = text.substr(prev.end_offset, chunks[i].core_offset - prev.end_offset);
        EXPECT_EQ(count_tokens(gap), 0u) << "gap before chunk " << i;
    }
    EXPECT_EQ(core_tokens, count_tokens(text));
    EXPECT_EQ(chunks.back().end_offset, text.size());
}

TEST_F(ChunkerTest, AdjacentChunksShareOverlapTokens) {
    std::set<std::size_t> sentences;
    for (std::size_t i = 4; i < 200; i += 9) sentences.insert(i);
    const auto chunks = chunker_.chunk("doc", make_text(200, sentences)).to_vector();
    ASSERT_GT(chunks.size(), 2u);

    for (std::size_t i = 1; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].overlap_tokens, 3u);
        const auto prev = token_strings(chunks[i - 1].text);
        const auto cur = token_strings(chunks[i].text);
        ASSERT_GE(cur.size(), 3u);
        EXPECT_EQ(std::vector<std::string>(prev.end() - 3, prev.end()),
                  std::vector<std::string>(cur.begin(), cur.begin() + 3))
            << "chunk " << i;
    }
}

TEST_F(ChunkerTest, TokenCountsStayWithinBounds) {
    std::set<std::size_t> sentences;
    for (std::size_t i = 2; i < 500; i += 13) sentences.insert(i);
    const auto chunks = chunker_.chunk("doc", make_text(500, sentences)).to_vector();

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_LE(chunks[i].token_count, 24u);
        if (i + 1 < chunks.size()) {
            EXPECT_GE(chunks[i].token_count, 16u);
        }
        EXPECT_EQ(chunks[i].token_count, count_tokens(chunks[i].text));
    }
}

TEST_F(ChunkerTest, ZeroOverlapProducesDisjointChunks) {
    Chunker chunker(small_config(0.0));
    const auto chunks = chunker.chunk("doc", make_text(75)).to_vector();

    std::size_t total = 0;
    for (const auto& chunk : chunks) {
        EXPECT_EQ(chunk.overlap_tokens, 0u);
        EXPECT_EQ(chunk.core_offset, chunk.start_offset);
        total += chunk.token_count;
    }
    EXPECT_EQ(total, 75u);
}

TEST_F(ChunkerTest, PerCallParametersOverrideConfig) {
    const auto sequence = chunker_.chunk("doc", make_text(40), 10, 0.2);
    EXPECT_EQ(sequence.params().target_tokens, 10u);
    EXPECT_EQ(sequence.params().overlap_tokens(), 2u);

    const auto chunks = sequence.to_vector();
    ASSERT_GT(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].token_count, 10u);
    EXPECT_EQ(chunks[1].overlap_tokens, 2u);
    EXPECT_DOUBLE_EQ(chunks[1].overlap_ratio, 0.2);
}

TEST_F(ChunkerTest, SequenceIsRestartable) {
    const auto sequence = chunker_.chunk("doc", make_text(120));

    std::vector<std::string> first;
    for (const auto& chunk : sequence) {
        first.push_back(chunk.id);
    }
    std::vector<std::string> second;
    for (auto it = sequence.begin(); it != sequence.end(); ++it) {
        second.push_back(it->id);
    }

    EXPECT_EQ(first, second);
    ASSERT_FALSE(first.empty());
    EXPECT_EQ(first.front(), "doc_chunk_0");
    EXPECT_EQ(first.back(), "doc_chunk_" + std::to_string(first.size() - 1));
    EXPECT_EQ(sequence.token_count(), 120u);
}

TEST_F(ChunkerTest, RejectsEmptyInput) {
    EXPECT_THROW(chunker_.chunk("doc", ""), InputError);
    EXPECT_THROW(chunker_.chunk("doc", "  \n\t \n"), InputError);
    EXPECT_THROW(chunker_.chunk("", "some text"), InputError);
}

TEST_F(ChunkerTest, RejectsOutOfRangeParameters) {
    EXPECT_THROW(chunker_.chunk("doc", "some text", 0, 0.15), InputError);
    EXPECT_THROW(chunker_.chunk("doc", "some text", 20, 0.5), InputError);
    EXPECT_THROW(chunker_.chunk("doc", "some text", 20, -0.1), InputError);

    ChunkingConfig bad;
    bad.boundary_tolerance = 1.0;
    EXPECT_THROW(Chunker{bad}, InputError);
}

TEST_F(ChunkerTest, SectionHeadingCarriesForward) {
    const std::string text = "INTRODUCTION\n\n" + make_text(60);
    const auto chunks = chunker_.chunk("doc", text).to_vector();

    ASSERT_GT(chunks.size(), 2u);
    for (const auto& chunk : chunks) {
        EXPECT_EQ(chunk.section_id, "INTRODUCTION");
    }
}

TEST_F(ChunkerTest, InjectedClassifierTagsChunks) {
    Chunker chunker(small_config(), std::make_shared<FixedClassifier>());
    const auto chunks = chunker.chunk("doc", make_text(30)).to_vector();

    ASSERT_FALSE(chunks.empty());
    for (const auto& chunk : chunks) {
        EXPECT_EQ(chunk.content_type, ContentType::FACTS);
        EXPECT_FLOAT_EQ(chunk.confidence_level, 0.75f);
    }
}

// =============================================================================
// Tokenizer
// =============================================================================

TEST(TokenizerTest, MarksSentenceAndParagraphBoundaries) {
    const std::string text = "He said \"stop.\" Then\n\nleft (quickly)";
    const auto tokens = tokenize(text);

    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_TRUE(tokens[2].ends_sentence);           // closing quote after the period
    EXPECT_FALSE(tokens[3].ends_sentence);
    EXPECT_TRUE(tokens[4].paragraph_break_before);  // "left"
    EXPECT_FALSE(tokens[3].paragraph_break_before);
    EXPECT_FALSE(tokens[0].paragraph_break_before);
}

TEST(TokenizerTest, TruncateKeepsWholeTokens) {
    EXPECT_EQ(truncate_to_tokens("one two three four", 2), "one two");
    EXPECT_EQ(truncate_to_tokens("one two", 5), "one two");
    EXPECT_EQ(count_tokens("  one\ttwo\n\nthree  "), 3u);
}

// =============================================================================
// Content classification
// =============================================================================

TEST(ContentClassifierTest, PicksTypeWithMostHits) {
    KeywordContentClassifier classifier;

    const auto theory = classifier.classify("Routine activity theory is a theoretical framework.");
    EXPECT_EQ(theory.type, ContentType::THEORY);
    EXPECT_FLOAT_EQ(theory.confidence, 1.0f);

    const auto analysis = classifier.classify("El análisis de la evidencia exige un segundo análisis.");
    EXPECT_EQ(analysis.type, ContentType::ANALYSIS);
    EXPECT_NEAR(analysis.confidence, 2.0f / 3.0f, 1e-6);
}

TEST(ContentClassifierTest, TiesFollowTypeOrder) {
    KeywordContentClassifier classifier;
    EXPECT_EQ(classifier.classify("theory and evidence").type, ContentType::THEORY);
    EXPECT_EQ(classifier.classify("the evidence, in conclusion").type, ContentType::FACTS);
}

TEST(ContentClassifierTest, NoKeywordsIsUnclassified) {
    KeywordContentClassifier classifier;
    const auto result = classifier.classify("the suspect drove north");
    EXPECT_EQ(result.type, ContentType::UNCLASSIFIED);
    EXPECT_FLOAT_EQ(result.confidence, 0.0f);
}

TEST(ContentClassifierTest, MatchesWholeWordsOnly) {
    KeywordContentClassifier classifier;
    EXPECT_EQ(classifier.count_hits("theorys modelling", ContentType::THEORY), 0u);
    EXPECT_EQ(classifier.count_hits("In summary, the summary", ContentType::CONCLUSION), 2u);
    EXPECT_EQ(classifier.count_hits("en resumen", ContentType::CONCLUSION), 1u);
    EXPECT_EQ(classifier.count_hits("un marco teórico", ContentType::THEORY), 1u);
}

TEST(SectionHeadingTest, RecognizesHeadingStyles) {
    EXPECT_EQ(detect_section_heading("INTRODUCTION\nbody text"), "INTRODUCTION");
    EXPECT_EQ(detect_section_heading("Criminal Profiling Methods\nbody"), "Criminal Profiling Methods");
    EXPECT_EQ(detect_section_heading("  3.1 Method overview  \nbody"), "3.1 Method overview");
    EXPECT_EQ(detect_section_heading("body text\n\nRESULTS"), "RESULTS");
}

TEST(SectionHeadingTest, IgnoresBodyText) {
    EXPECT_EQ(detect_section_heading("plain text line\nanother line\nthird line\nFOURTH"), "");
    EXPECT_EQ(detect_section_heading("A"), "");
}
