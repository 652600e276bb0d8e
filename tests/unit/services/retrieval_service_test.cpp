#include "lens_core/services/retrieval_service.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "lens_core/store/in_memory_vector_store.hpp"

namespace lens_tests {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

// Unit vector in the plane whose cosine with (1, 0) is `cosine`
std::vector<float> at_cosine(float cosine) {
  return {cosine, std::sqrt(1.0f - cosine * cosine)};
}

lens_core::ScoredChunk hit(lens_core::DocumentId document_id, int chunk_index, float similarity,
                           const std::string &content = "text") {
  lens_core::ScoredChunk chunk;
  chunk.document_id = document_id;
  chunk.chunk_index = chunk_index;
  chunk.content = content;
  chunk.document_title = "Doc " + std::to_string(document_id);
  chunk.document_slug = "doc-" + std::to_string(document_id);
  chunk.similarity = similarity;
  return chunk;
}

}  // namespace

class RetrievalServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<lens_core::InMemoryVectorStore>(2);
    gateway_ = std::make_shared<NiceMock<MockEmbeddingGateway>>(2);
    ON_CALL(*gateway_, embed(_)).WillByDefault(Return(std::vector<std::vector<float>>{{1.0f, 0.0f}}));
    service_ = std::make_unique<lens_core::RetrievalService>(store_, gateway_);
  }

  lens_core::DocumentId add(const std::string &external_id,
                            const std::vector<std::vector<float>> &vectors,
                            const std::string &content = "document body") {
    auto id = store_->upsert_document(
        TestUtilities::create_test_document(external_id, "Title " + external_id, content));
    std::vector<lens_core::Chunk> chunks;
    for (size_t i = 0; i < vectors.size(); ++i) {
      chunks.push_back(TestUtilities::create_test_chunk(
          static_cast<int>(i), external_id + " excerpt " + std::to_string(i), vectors[i]));
    }
    store_->upsert_chunks(id, chunks);
    return id;
  }

  std::shared_ptr<lens_core::InMemoryVectorStore> store_;
  std::shared_ptr<NiceMock<MockEmbeddingGateway>> gateway_;
  std::unique_ptr<lens_core::RetrievalService> service_;
};

TEST_F(RetrievalServiceTest, ThresholdKeepsCloseChunkAndDropsDistantOne) {
  auto x = add("x", {at_cosine(0.82f)});
  add("y", {at_cosine(0.30f)});

  auto results = service_->retrieve("how do I tune sqlite?", 10, 0.5f);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].document_id, x);
  EXPECT_NEAR(results[0].similarity, 0.82f, 1e-5);
  EXPECT_EQ(results[0].content, "x excerpt 0");
  EXPECT_EQ(results[0].document_title, "Title x");
}

TEST_F(RetrievalServiceTest, ResultsAreOrderedAndCapped) {
  auto a = add("a", {at_cosine(0.6f), at_cosine(0.9f)});
  auto b = add("b", {at_cosine(0.9f), at_cosine(0.7f)});

  auto results = service_->retrieve("query", 3, 0.0f);

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].document_id, a);
  EXPECT_EQ(results[0].chunk_index, 1);
  EXPECT_EQ(results[1].document_id, b);
  EXPECT_EQ(results[1].chunk_index, 0);
  EXPECT_NEAR(results[2].similarity, 0.7f, 1e-5);
}

TEST_F(RetrievalServiceTest, ExcludedDocumentNeverAppears) {
  auto a = add("a", {at_cosine(0.99f)});
  auto b = add("b", {at_cosine(0.6f)});

  auto results = service_->retrieve("query", 10, 0.0f, a);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].document_id, b);
}

TEST_F(RetrievalServiceTest, RejectsMeaninglessRequestsBeforeEmbedding) {
  EXPECT_CALL(*gateway_, embed(_)).Times(0);

  EXPECT_THROW(service_->retrieve("query", 0, 0.5f), lens_core::ConfigurationError);
  EXPECT_THROW(service_->retrieve("query", 5, 1.5f), lens_core::ConfigurationError);
  EXPECT_THROW(service_->retrieve("  \n\t", 5, 0.5f), lens_core::ConfigurationError);
}

TEST_F(RetrievalServiceTest, GatewayFailurePropagates) {
  ON_CALL(*gateway_, embed(_))
      .WillByDefault(::testing::Throw(
          lens_core::CollaboratorError("connection refused", lens_core::FailureKind::Transient)));

  EXPECT_THROW(service_->retrieve("query", 5, 0.5f), lens_core::CollaboratorError);
}

TEST_F(RetrievalServiceTest, SuggestLinksSkipsSourceAndKeepsOneEntryPerDocument) {
  auto source = add("source", {at_cosine(1.0f)}, "The source article body");
  auto close = add("close", {at_cosine(0.95f), at_cosine(0.9f)});
  auto farther = add("farther", {at_cosine(0.8f)});
  add("unrelated", {at_cosine(0.1f)});

  EXPECT_CALL(*gateway_, embed(std::vector<std::string>{"The source article body"}));

  auto links = service_->suggest_links(source, 10, 0.5f, 5);

  ASSERT_EQ(links.size(), 2u);
  EXPECT_EQ(links[0].document_id, close);
  EXPECT_EQ(links[0].title, "Title close");
  EXPECT_EQ(links[0].best_chunk.chunk_index, 0);
  EXPECT_EQ(links[1].document_id, farther);
}

TEST_F(RetrievalServiceTest, SuggestLinksHonoursMaxLinks) {
  auto source = add("source", {at_cosine(1.0f)});
  auto best = add("best", {at_cosine(0.9f)});
  add("next", {at_cosine(0.8f)});

  auto links = service_->suggest_links(source, 10, 0.5f, 1);

  ASSERT_EQ(links.size(), 1u);
  EXPECT_EQ(links[0].document_id, best);
}

TEST_F(RetrievalServiceTest, SuggestLinksForUnknownDocumentFails) {
  EXPECT_THROW(service_->suggest_links(404, 10, 0.5f, 3), lens_core::ConfigurationError);
  auto source = add("source", {at_cosine(1.0f)});
  EXPECT_THROW(service_->suggest_links(source, 10, 0.5f, 0), lens_core::ConfigurationError);
}

TEST(RetrievalGroupingTest, GroupsByDocumentInFirstSeenOrder) {
  std::vector<lens_core::ScoredChunk> results = {hit(2, 0, 0.9f, "a"), hit(1, 3, 0.8f, "b"),
                                                 hit(2, 1, 0.7f, "c"), hit(2, 4, 0.6f, "d"),
                                                 hit(1, 0, 0.5f, "e")};

  auto groups = lens_core::RetrievalService::group_by_document(results, 2, 600);

  ASSERT_EQ(groups.size(), 2u);
  EXPECT_EQ(groups[0].document_id, 2);
  EXPECT_FLOAT_EQ(groups[0].best_similarity, 0.9f);
  EXPECT_EQ(groups[0].excerpts, (std::vector<std::string>{"a", "c"}));
  EXPECT_EQ(groups[1].document_id, 1);
  EXPECT_EQ(groups[1].title, "Doc 1");
  EXPECT_EQ(groups[1].excerpts, (std::vector<std::string>{"b", "e"}));
}

TEST(RetrievalGroupingTest, ExcerptsAreCutOnCharacterBoundaries) {
  auto groups = lens_core::RetrievalService::group_by_document({hit(1, 0, 0.9f, "naïve café")}, 3, 3);

  ASSERT_EQ(groups.size(), 1u);
  EXPECT_EQ(groups[0].excerpts[0], "na");
}

TEST(TruncateUtf8Test, NeverSplitsMultiByteSequences) {
  EXPECT_EQ(lens_core::truncate_utf8("héllo", 2), "h");
  EXPECT_EQ(lens_core::truncate_utf8("héllo", 3), "hé");
  EXPECT_EQ(lens_core::truncate_utf8("日本語", 7), "日本");
  EXPECT_EQ(lens_core::truncate_utf8("short", 100), "short");
  EXPECT_EQ(lens_core::truncate_utf8("abc", 0), "");
}

}  // namespace lens_tests
