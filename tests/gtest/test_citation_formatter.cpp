// =============================================================================
// Citation Formatter Tests
// =============================================================================

#include <gtest/gtest.h>
#include "mocks.hpp"
#include "crimrag/error.hpp"
#include "crimrag/pipeline/citation_formatter.hpp"

using namespace crimrag;
using namespace crimrag::pipeline;
using namespace crimrag::testing_support;

class CitationFormatterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto fbi = make_document("fbi_serial_murder.pdf", 0, "first", 0.9f, 1);
        fbi.metadata.document_authority = "FBI";
        fbi.metadata.source_reliability = SourceReliability::HIGH;
        fbi.metadata.publication_year = 2008;
        fbi.metadata.crime_type = "homicide";

        auto canter = make_document("canter_profiling.pdf", 3, "second", 0.8f, 2);
        canter.metadata.source_reliability = SourceReliability::MEDIUM;

        auto fbi_again = make_document("fbi_serial_murder.pdf", 7, "third", 0.7f, 3);
        fbi_again.metadata = fbi.metadata;

        documents_ = {fbi, canter, fbi_again};
    }

    CitationFormatter formatter_;
    std::vector<RetrievedDocument> documents_;
};

TEST_F(CitationFormatterTest, OneCitationPerSourceInFirstAppearanceOrder) {
    const auto citations = CitationFormatter::collect_citations(documents_);

    ASSERT_EQ(citations.size(), 2u);
    EXPECT_EQ(citations[0].number, 1u);
    EXPECT_EQ(citations[0].document_name, "fbi_serial_murder.pdf");
    EXPECT_EQ(citations[0].chunk_ids,
              (std::vector<std::string>{"fbi_serial_murder.pdf_chunk_0", "fbi_serial_murder.pdf_chunk_7"}));
    EXPECT_EQ(citations[1].number, 2u);
    EXPECT_EQ(citations[1].document_name, "canter_profiling.pdf");
    EXPECT_EQ(citations[1].chunk_ids, (std::vector<std::string>{"canter_profiling.pdf_chunk_3"}));
}

TEST_F(CitationFormatterTest, RendersPresentFieldsOnly) {
    const auto citations = CitationFormatter::collect_citations(documents_);

    EXPECT_EQ(CitationFormatter::render_citation(citations[0]),
              "[1] fbi_serial_murder.pdf (FBI) - reliability: high - 2008 - crime type: homicide");
    EXPECT_EQ(CitationFormatter::render_citation(citations[1]),
              "[2] canter_profiling.pdf - reliability: medium");
    EXPECT_FALSE(citations[1].authority.has_value());
    EXPECT_FALSE(citations[1].year.has_value());
}

TEST_F(CitationFormatterTest, AppendsSourcesBlock) {
    const auto formatted = formatter_.format("Profilers infer traits [1].", documents_);

    EXPECT_EQ(formatted.text,
              "Profilers infer traits [1]."
              "\n\n---\n\nSources:\n"
              "[1] fbi_serial_murder.pdf (FBI) - reliability: high - 2008 - crime type: homicide\n"
              "[2] canter_profiling.pdf - reliability: medium");
    EXPECT_EQ(formatted.citations.size(), 2u);
}

TEST_F(CitationFormatterTest, NoDocumentsMeansNoSourcesBlock) {
    const auto formatted = formatter_.format("Nothing to cite.", {});
    EXPECT_EQ(formatted.text, "Nothing to cite.");
    EXPECT_TRUE(formatted.citations.empty());
}

TEST_F(CitationFormatterTest, OutputDependsOnlyOnInputs) {
    const auto first = formatter_.format("Answer.", documents_);
    const auto second = CitationFormatter{}.format("Answer.", documents_);
    EXPECT_EQ(first.text, second.text);
}

TEST_F(CitationFormatterTest, MissingNameRendersUnknown) {
    auto doc = make_document("", 0, "text");
    doc.chunk = nullptr;
    const auto citations = CitationFormatter::collect_citations({doc});

    ASSERT_EQ(citations.size(), 1u);
    EXPECT_EQ(citations[0].document_name, "unknown");
    EXPECT_TRUE(citations[0].chunk_ids.empty());
}

TEST_F(CitationFormatterTest, RejectsUnusableResponseText) {
    EXPECT_THROW(formatter_.format("", documents_), FormatError);
    EXPECT_THROW(formatter_.format(" \n\t", documents_), FormatError);
    EXPECT_THROW(formatter_.format(std::string("bad\0text", 8), documents_), FormatError);
}
