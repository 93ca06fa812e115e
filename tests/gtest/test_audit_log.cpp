// =============================================================================
// Audit Log Tests
// =============================================================================

#include <gtest/gtest.h>
#include "mocks.hpp"
#include "crimrag/pipeline/audit_log.hpp"

#include <boost/json.hpp>

#include <filesystem>
#include <fstream>

using namespace crimrag;
using namespace crimrag::pipeline;
using namespace crimrag::testing_support;

namespace fs = std::filesystem;

namespace {

// 2024-03-05T14:07:09.000250Z
std::chrono::system_clock::time_point fixed_time() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1709647629)) +
           std::chrono::microseconds(250);
}

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

class AuditLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / (std::string("crimrag_audit_") + info->name());
        fs::remove_all(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    PipelineState finished_state() {
        PipelineState state("What is serial murder?");
        auto doc = make_document("fbi.pdf", 0, "Serial murder is the unlawful killing of two or more victims.");
        state.set_documents({doc});
        state.advance(Stage::RETRIEVED);
        state.set_context("context", {doc});
        state.set_prompt("prompt text");
        state.set_response("Answer.\n\n---\n\nSources:\n[1] fbi.pdf");
        Citation citation;
        citation.number = 1;
        citation.document_name = "fbi.pdf";
        citation.chunk_ids = {doc.chunk->id};
        state.set_sources({citation});
        state.advance(Stage::GENERATED);
        state.advance(Stage::FORMATTED);
        state.advance(Stage::DONE);
        return state;
    }

    fs::path dir_;
};

TEST_F(AuditLogTest, RecordCapturesFinishedState) {
    const auto record = make_audit_record(finished_state(), fixed_time());

    EXPECT_EQ(record.log_id, "query_20240305_140709_000250");
    EXPECT_EQ(record.stage, Stage::DONE);
    EXPECT_EQ(record.documents.size(), 1u);
    EXPECT_EQ(record.prompt.value_or(""), "prompt text");
    EXPECT_EQ(record.sources.size(), 1u);
    EXPECT_FALSE(record.error.has_value());
}

TEST_F(AuditLogTest, JsonCarriesEveryBlock) {
    const auto json = to_json(make_audit_record(finished_state(), fixed_time()));

    EXPECT_EQ(json.at("timestamp").as_string(), "2024-03-05T14:07:09.000250Z");
    EXPECT_EQ(json.at("stage").as_string(), "done");
    EXPECT_EQ(json.at("query").as_object().at("original").as_string(), "What is serial murder?");
    EXPECT_EQ(json.at("documents").as_object().at("count").as_uint64(), 1u);
    EXPECT_EQ(json.at("documents").as_object().at("documents").as_array()[0].as_object().at("id").as_string(),
              "fbi.pdf_chunk_0");
    EXPECT_EQ(json.at("prompt").as_object().at("full_prompt").as_string(), "prompt text");
    EXPECT_EQ(json.at("response").as_object().at("sources_count").as_uint64(), 1u);
    EXPECT_EQ(json.at("sources").as_array().size(), 1u);
    EXPECT_TRUE(json.at("error").is_null());
}

TEST_F(AuditLogTest, JsonDescribesFailure) {
    PipelineState state("What is serial murder?");
    PipelineError error;
    error.kind = ErrorCode::GENERATION_ERROR;
    error.message = "429 Too Many Requests";
    error.generation_kind = GenerationErrorKind::RATE_LIMITED;
    state.fail(error);

    const auto json = to_json(make_audit_record(state, fixed_time()));
    const auto& block = json.at("error").as_object();
    EXPECT_EQ(block.at("kind").as_string(), "GenerationError");
    EXPECT_EQ(block.at("generation_kind").as_string(), "RateLimited");
    EXPECT_TRUE(block.at("retryable").as_bool());
    EXPECT_TRUE(json.at("response").is_null());
    EXPECT_EQ(json.at("metadata").as_object().at("failed_at").as_string(), "start");
}

TEST_F(AuditLogTest, AppendsOneLinePerRecordToDailyFile) {
    JsonlAuditLog log(dir_);
    const auto record = make_audit_record(finished_state(), fixed_time());
    log.record(record);
    log.record(record);

    const fs::path path = dir_ / "queries_20240305.jsonl";
    EXPECT_EQ(log.file_for(fixed_time()), path);
    ASSERT_TRUE(fs::exists(path));

    const auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u);
    for (const auto& line : lines) {
        const auto parsed = boost::json::parse(line).as_object();
        EXPECT_EQ(parsed.at("log_id").as_string(), "query_20240305_140709_000250");
        // Multi-line response text stays on one line.
        EXPECT_EQ(parsed.at("response").as_object().at("text").as_string(),
                  "Answer.\n\n---\n\nSources:\n[1] fbi.pdf");
    }
}

TEST_F(AuditLogTest, IngestionRecordsGoToTheirOwnFile) {
    IngestionRecord record;
    record.timestamp = fixed_time();
    record.file_path = "/corpus/fbi_serial_murder.txt";
    record.document_id = "fbi_serial_murder";
    record.chunks_created = 12;
    record.collection = "criminology_corpus";
    record.metadata.source = "FBI Serial Murder Report";
    record.metadata.source_reliability = SourceReliability::HIGH;

    JsonlAuditLog log(dir_);
    log.record_ingestion(record);

    EXPECT_FALSE(fs::exists(log.file_for(fixed_time())));
    const auto lines = read_lines(dir_ / "ingestion.jsonl");
    ASSERT_EQ(lines.size(), 1u);

    const auto parsed = boost::json::parse(lines[0]).as_object();
    EXPECT_EQ(parsed.at("type").as_string(), "ingestion");
    EXPECT_EQ(parsed.at("timestamp").as_string(), "2024-03-05T14:07:09.000250Z");
    EXPECT_EQ(parsed.at("file_path").as_string(), "/corpus/fbi_serial_murder.txt");
    EXPECT_EQ(parsed.at("chunks_created").as_int64(), 12);
    EXPECT_EQ(parsed.at("collection").as_string(), "criminology_corpus");
    const auto& metadata = parsed.at("metadata").as_object();
    EXPECT_EQ(metadata.at("source").as_string(), "FBI Serial Murder Report");
    EXPECT_EQ(metadata.at("source_reliability").as_string(), "high");
    EXPECT_FALSE(metadata.contains("crime_type"));
}

TEST_F(AuditLogTest, UnwritableDirectoryThrows) {
    const fs::path blocker = fs::temp_directory_path() / "crimrag_audit_blocker";
    {
        std::ofstream out(blocker);
        out << "file, not a directory";
    }

    JsonlAuditLog log(blocker / "nested");
    EXPECT_THROW(log.record(make_audit_record(finished_state(), fixed_time())), IOError);
    fs::remove(blocker);
}
