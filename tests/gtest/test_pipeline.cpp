// =============================================================================
// Pipeline Orchestration Tests
// =============================================================================

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "mocks.hpp"
#include "crimrag/error.hpp"
#include "crimrag/generation/prompts.hpp"
#include "crimrag/pipeline/pipeline.hpp"

#include <mutex>

using namespace crimrag;
using namespace crimrag::pipeline;
using namespace crimrag::testing_support;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        index_ = std::make_shared<NiceMock<MockIndexAdapter>>();
        generator_ = std::make_shared<MockGenerationClient>();
        scorer_ = std::make_shared<MockScoringClient>();
        audit_ = std::make_shared<NiceMock<MockAuditSink>>();

        ON_CALL(*index_, embed(_, _)).WillByDefault(Return(Embedding{1.0f, 0.0f}));

        auto fbi = make_candidate("fbi_serial_murder", 0, 0.9f, 0);
        fbi.chunk = make_chunk("fbi_serial_murder", 0, "Serial murder is the unlawful killing of two or more victims.");
        fbi.metadata.document_authority = "FBI";
        auto canter = make_candidate("canter_profiling", 2, 0.8f, 1);
        canter.chunk = make_chunk("canter_profiling", 2, "Investigative psychology links offender actions to traits.");
        candidates_ = {fbi, canter};
    }

    std::shared_ptr<PipelineContext> make_context() {
        auto context = std::make_shared<PipelineContext>();
        context->config = config_;
        context->index = index_;
        context->generator = generator_;
        context->scorer = scorer_;
        context->audit = audit_;
        return context;
    }

    Pipeline make_pipeline() {
        return Pipeline(make_context(), [this](std::chrono::milliseconds delay) {
            std::lock_guard<std::mutex> lock(delays_mutex_);
            delays_.push_back(delay.count());
        });
    }

    void expect_retrieval() {
        EXPECT_CALL(*index_, similarity_search(_, _, _, _)).WillRepeatedly(Return(candidates_));
    }

    Config config_;
    std::shared_ptr<NiceMock<MockIndexAdapter>> index_;
    std::shared_ptr<MockGenerationClient> generator_;
    std::shared_ptr<MockScoringClient> scorer_;
    std::shared_ptr<NiceMock<MockAuditSink>> audit_;
    std::vector<index::IndexCandidate> candidates_;

    std::mutex delays_mutex_;
    std::vector<long long> delays_;
};

// =============================================================================
// Success paths
// =============================================================================

TEST_F(PipelineTest, AnswersWithSourcesBlock) {
    expect_retrieval();
    EXPECT_CALL(*generator_, generate(HasSubstr("[Document 1 - Source: fbi_serial_murder.pdf]"), 1200, _))
        .WillOnce(Return("Serial murder involves two or more victims [1]."));

    auto pipeline = make_pipeline();
    const auto result = pipeline.run("What is serial murder?");

    ASSERT_TRUE(result.ok());
    ASSERT_TRUE(result.response.has_value());
    EXPECT_EQ(result.response->rfind("Serial murder involves two or more victims [1].", 0), 0u);
    EXPECT_THAT(*result.response, HasSubstr("\n\n---\n\nSources:\n[1] fbi_serial_murder.pdf (FBI)"));
    ASSERT_EQ(result.sources.size(), 2u);
    EXPECT_EQ(result.sources[1].document_name, "canter_profiling.pdf");

    EXPECT_EQ(result.metadata.at("stage").as_string(), "done");
    EXPECT_EQ(result.metadata.at("retrieved_count").as_uint64(), 2u);
    EXPECT_EQ(result.metadata.at("reranker").as_string(), "pass_through");
    EXPECT_EQ(result.metadata.at("generation_attempts").as_uint64(), 1u);
    EXPECT_TRUE(result.metadata.at("timings_ms").as_object().contains("retrieve"));
    EXPECT_TRUE(result.metadata.at("timings_ms").as_object().contains("total"));
    EXPECT_TRUE(delays_.empty());
}

TEST_F(PipelineTest, EmptyRetrievalGivesInsufficientEvidence) {
    EXPECT_CALL(*index_, similarity_search(_, _, _, _)).WillOnce(Return(std::vector<index::IndexCandidate>{}));
    EXPECT_CALL(*generator_, generate(_, _, _)).Times(0);

    auto pipeline = make_pipeline();
    const auto result = pipeline.run("What is the recidivism rate of arsonists?");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.response.value_or(""), generation::prompts::insufficient_evidence_message());
    EXPECT_TRUE(result.sources.empty());
    EXPECT_TRUE(result.metadata.at("empty_result").as_bool());
    EXPECT_EQ(result.metadata.at("stage").as_string(), "done");
}

TEST_F(PipelineTest, ContextWithoutRoomForDocumentsSkipsGeneration) {
    expect_retrieval();
    EXPECT_CALL(*generator_, generate(_, _, _)).Times(0);
    EXPECT_CALL(*audit_, record(_))
        .WillOnce(Invoke([](const AuditRecord& record) {
            EXPECT_EQ(record.stage, Stage::DONE);
            EXPECT_TRUE(record.documents.empty());
        }));

    QueryOptions options;
    options.max_context_tokens = 1;

    auto pipeline = make_pipeline();
    const auto result = pipeline.run("What is serial murder?", options);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.response.value_or(""), generation::prompts::insufficient_evidence_message());
    EXPECT_TRUE(result.sources.empty());
    EXPECT_EQ(result.metadata.at("retrieved_count").as_uint64(), 2u);
    EXPECT_EQ(result.metadata.at("context_documents").as_uint64(), 0u);
    EXPECT_EQ(result.metadata.at("generation_attempts").as_int64(), 0);
}

TEST_F(PipelineTest, ForwardsOptionsToComponents) {
    QueryOptions options;
    options.k = 4;
    options.timeout = std::chrono::milliseconds(250);
    options.filters.require("crime_type", "homicide");

    candidates_[0].metadata.crime_type = "homicide";
    candidates_[1].metadata.crime_type = "homicide";
    EXPECT_CALL(*index_, similarity_search(_, std::size_t{12}, _, std::chrono::milliseconds(250)))
        .WillOnce(Return(candidates_));
    EXPECT_CALL(*generator_, generate(_, _, std::chrono::milliseconds(250))).WillOnce(Return("Answer."));

    auto pipeline = make_pipeline();
    const auto result = pipeline.run("Homicide patterns?", options);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.metadata.at("filters").as_string(), "crime_type=homicide");
}

TEST_F(PipelineTest, RerankerReordersWhenRequested) {
    expect_retrieval();
    EXPECT_CALL(*scorer_, score_batch(_, _)).WillOnce(Return(std::vector<float>{0.1f, 0.9f}));
    EXPECT_CALL(*generator_, generate(_, _, _)).WillOnce(Return("Answer."));

    QueryOptions options;
    options.use_reranker = true;
    auto pipeline = make_pipeline();
    const auto state = pipeline.execute("How does investigative psychology work?", options);

    EXPECT_EQ(state.stage(), Stage::DONE);
    ASSERT_TRUE(state.reranked_documents().has_value());
    EXPECT_EQ(state.context_documents().front().source_name(), "canter_profiling.pdf");
    EXPECT_EQ(state.sources()->front().document_name, "canter_profiling.pdf");
    EXPECT_EQ(state.metadata().at("reranker").as_string(), "scoring");
}

TEST_F(PipelineTest, RerankFailureContinuesWithRetrievalOrder) {
    expect_retrieval();
    EXPECT_CALL(*scorer_, score_batch(_, _)).WillOnce(Throw(ScoringError("scoring service down")));
    EXPECT_CALL(*generator_, generate(_, _, _)).WillOnce(Return("Answer."));

    QueryOptions options;
    options.use_reranker = true;
    auto pipeline = make_pipeline();
    const auto result = pipeline.run("What is serial murder?", options);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.metadata.at("rerank_error").as_string(), "scoring service down");
    EXPECT_EQ(result.sources.front().document_name, "fbi_serial_murder.pdf");
}

// =============================================================================
// Failure paths
// =============================================================================

TEST_F(PipelineTest, IndexFailureStopsBeforeGeneration) {
    EXPECT_CALL(*index_, similarity_search(_, _, _, _)).WillOnce(Throw(IndexUnavailableError("connection refused")));
    EXPECT_CALL(*generator_, generate(_, _, _)).Times(0);

    auto pipeline = make_pipeline();
    const auto result = pipeline.run("What is serial murder?");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorCode::INDEX_UNAVAILABLE);
    EXPECT_TRUE(result.error->retryable());
    EXPECT_FALSE(result.response.has_value());
    EXPECT_TRUE(result.sources.empty());
    EXPECT_EQ(result.metadata.at("stage").as_string(), "failed");
    EXPECT_EQ(result.metadata.at("failed_at").as_string(), "start");
}

TEST_F(PipelineTest, GenerationRetriesWithBackoffThenFails) {
    expect_retrieval();
    EXPECT_CALL(*generator_, generate(_, _, _))
        .Times(4)
        .WillRepeatedly(Throw(GenerationError(GenerationErrorKind::RATE_LIMITED, "429 Too Many Requests")));

    auto pipeline = make_pipeline();
    const auto result = pipeline.run("What is serial murder?");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorCode::GENERATION_ERROR);
    EXPECT_EQ(result.error->generation_kind, GenerationErrorKind::RATE_LIMITED);
    EXPECT_FALSE(result.response.has_value());
    EXPECT_EQ(delays_, (std::vector<long long>{1000, 2000, 4000}));
    EXPECT_EQ(result.metadata.at("generation_attempts").as_uint64(), 4u);
    EXPECT_EQ(result.metadata.at("failed_at").as_string(), "retrieved");
}

TEST_F(PipelineTest, GenerationRecoversAfterRetry) {
    expect_retrieval();
    EXPECT_CALL(*generator_, generate(_, _, _))
        .WillOnce(Throw(GenerationError(GenerationErrorKind::TIMEOUT, "deadline exceeded")))
        .WillOnce(Throw(std::runtime_error("connection reset")))
        .WillOnce(Return("Recovered answer."));

    auto pipeline = make_pipeline();
    const auto result = pipeline.run("What is serial murder?");

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(delays_, (std::vector<long long>{1000, 2000}));
    EXPECT_EQ(result.metadata.at("generation_attempts").as_uint64(), 3u);
}

TEST_F(PipelineTest, BackoffIsCapped) {
    config_.generation.max_backoff_ms = 3000;
    auto pipeline = make_pipeline();

    EXPECT_EQ(pipeline.backoff_delay(0).count(), 1000);
    EXPECT_EQ(pipeline.backoff_delay(1).count(), 2000);
    EXPECT_EQ(pipeline.backoff_delay(2).count(), 3000);
    EXPECT_EQ(pipeline.backoff_delay(6).count(), 3000);
}

TEST_F(PipelineTest, BlankGenerationIsFormatError) {
    expect_retrieval();
    EXPECT_CALL(*generator_, generate(_, _, _)).WillOnce(Return("  \n"));

    auto pipeline = make_pipeline();
    const auto result = pipeline.run("What is serial murder?");

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorCode::FORMAT_ERROR);
    EXPECT_FALSE(result.error->retryable());
    EXPECT_EQ(result.metadata.at("failed_at").as_string(), "generated");
}

TEST_F(PipelineTest, CancelledQueryStopsImmediately) {
    EXPECT_CALL(*index_, similarity_search(_, _, _, _)).Times(0);
    EXPECT_CALL(*generator_, generate(_, _, _)).Times(0);

    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    QueryOptions options;
    options.cancel = token;

    auto pipeline = make_pipeline();
    const auto result = pipeline.run("What is serial murder?", options);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error->kind, ErrorCode::CANCELLED);
    EXPECT_FALSE(result.response.has_value());
}

TEST_F(PipelineTest, RejectsInvalidQueryWithoutAudit) {
    EXPECT_CALL(*audit_, record(_)).Times(0);

    auto pipeline = make_pipeline();
    const auto blank = pipeline.run("   ");
    ASSERT_FALSE(blank.ok());
    EXPECT_EQ(blank.error->kind, ErrorCode::INPUT_ERROR);
    EXPECT_EQ(blank.metadata.at("stage").as_string(), "rejected");

    QueryOptions options;
    options.k = 0;
    EXPECT_EQ(pipeline.run("valid question", options).error->kind, ErrorCode::INPUT_ERROR);
    EXPECT_EQ(pipeline.run(std::string(config_.pipeline.max_query_chars + 1, 'x')).error->kind,
              ErrorCode::INPUT_ERROR);
    EXPECT_THROW(pipeline.execute(""), InputError);
}

// =============================================================================
// Audit and batches
// =============================================================================

TEST_F(PipelineTest, AuditsEveryInvocationOnce) {
    expect_retrieval();
    EXPECT_CALL(*generator_, generate(_, _, _)).WillOnce(Return("Answer."));
    EXPECT_CALL(*audit_, record(_))
        .WillOnce(Invoke([](const AuditRecord& record) {
            EXPECT_EQ(record.stage, Stage::DONE);
            EXPECT_EQ(record.query, "What is serial murder?");
            EXPECT_EQ(record.documents.size(), 2u);
            EXPECT_TRUE(record.response.has_value());
        }));

    auto pipeline = make_pipeline();
    EXPECT_TRUE(pipeline.run("What is serial murder?").ok());
}

TEST_F(PipelineTest, AuditFailureDoesNotAffectResult) {
    expect_retrieval();
    EXPECT_CALL(*generator_, generate(_, _, _)).WillOnce(Return("Answer."));
    EXPECT_CALL(*audit_, record(_)).WillOnce(Throw(IOError("disk full")));

    auto pipeline = make_pipeline();
    EXPECT_TRUE(pipeline.run("What is serial murder?").ok());
}

TEST_F(PipelineTest, BatchKeepsInputOrder) {
    config_.pipeline.max_concurrent_queries = 2;
    expect_retrieval();

    const std::vector<std::string> queries = {"alpha question", "beta question", "gamma question", "   "};
    EXPECT_CALL(*generator_, generate(_, _, _))
        .Times(3)
        .WillRepeatedly(Invoke([&queries](const std::string& prompt, std::size_t, std::chrono::milliseconds) {
            for (const auto& query : queries) {
                if (prompt.find(query) != std::string::npos) {
                    return "answer to " + query;
                }
            }
            return std::string("unmatched");
        }));

    auto pipeline = make_pipeline();
    const auto results = pipeline.run_batch(queries);

    ASSERT_EQ(results.size(), 4u);
    for (std::size_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(results[i].ok());
        EXPECT_EQ(results[i].response->rfind("answer to " + queries[i], 0), 0u);
    }
    EXPECT_EQ(results[3].error->kind, ErrorCode::INPUT_ERROR);
}

TEST_F(PipelineTest, RequiresIndexAndGenerator) {
    auto context = make_context();
    context->generator = nullptr;
    EXPECT_THROW((Pipeline(context)), InputError);
    EXPECT_THROW((Pipeline(nullptr)), InputError);
}
