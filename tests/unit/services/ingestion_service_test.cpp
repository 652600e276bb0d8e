#include "lens_core/services/ingestion_service.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "lens_core/ingestion/content_hash.hpp"
#include "lens_core/store/in_memory_vector_store.hpp"

namespace lens_tests {

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using lens_core::CollaboratorError;
using lens_core::FailureKind;

namespace {

// Three level-2 sections that each stay their own chunk under the small budget below
std::string three_section_article(const std::string &word) {
  return "# Article\n\n## One\n\n" + TestUtilities::repeat_words(15, word) + "\n\n## Two\n\n" +
         TestUtilities::repeat_words(15, word) + "\n\n## Three\n\n" +
         TestUtilities::repeat_words(15, word);
}

// Fits in a single chunk
std::string one_section_article(const std::string &word) {
  return "# Article\n\n" + TestUtilities::repeat_words(12, word);
}

bool mentions(const std::vector<std::string> &texts, const std::string &needle) {
  for (const auto &text : texts) {
    if (text.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

class IngestionServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<lens_core::InMemoryVectorStore>(4);
    gateway_ = std::make_shared<NiceMock<MockEmbeddingGateway>>(4);
    chunker_ = std::make_shared<lens_core::MarkdownChunker>(
        std::make_shared<lens_core::WordPieceTokenizer>(),
        lens_core::ChunkerOptions{.max_chunk_tokens = 20, .merge_threshold_tokens = 10});
    service_ = make_service(store_);
  }

  std::unique_ptr<lens_core::IngestionService> make_service(lens_core::VectorStorePtr store) {
    return std::make_unique<lens_core::IngestionService>(
        std::move(store), gateway_, chunker_, TestUtilities::instant_retry_policy(3, &sleeps_),
        lens_core::IngestionOptions{.min_document_bytes = 50, .embedding_batch_size = 2});
  }

  lens_core::Document doc(const std::string &external_id, const std::string &content) {
    return TestUtilities::create_test_document(external_id, "Title " + external_id, content);
  }

  std::shared_ptr<lens_core::InMemoryVectorStore> store_;
  std::shared_ptr<NiceMock<MockEmbeddingGateway>> gateway_;
  std::shared_ptr<lens_core::MarkdownChunker> chunker_;
  std::vector<std::chrono::milliseconds> sleeps_;
  std::unique_ptr<lens_core::IngestionService> service_;
};

TEST_F(IngestionServiceTest, StoresEveryChunkWithItsEmbedding) {
  std::string content = three_section_article("alpha");
  size_t expected_chunks = chunker_->chunk(content).size();
  ASSERT_GT(expected_chunks, 2u);

  auto report = service_->ingest({doc("a", content), doc("b", one_section_article("bravo"))});

  EXPECT_EQ(report.processed, 2u);
  EXPECT_EQ(report.failed, 0u);
  EXPECT_EQ(report.chunks_written, expected_chunks + 1);
  EXPECT_EQ(store_->chunk_count(), expected_chunks + 1);

  auto stored = store_->find_document("a");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->content_hash, lens_core::compute_content_hash(content));
  for (const auto &vector : store_->chunk_embeddings(stored->id)) {
    EXPECT_EQ(vector.size(), 4u);
  }
}

TEST_F(IngestionServiceTest, EmbedsInBatchesOfConfiguredSize) {
  std::string content = three_section_article("alpha");
  size_t chunks = chunker_->chunk(content).size();

  EXPECT_CALL(*gateway_, embed(_)).Times(static_cast<int>((chunks + 1) / 2));

  service_->ingest({doc("a", content)});
}

TEST_F(IngestionServiceTest, SkipsDocumentsBelowMinimumSize) {
  EXPECT_CALL(*gateway_, embed(_)).Times(0);

  auto report = service_->ingest({doc("tiny", "# Tiny\n\nshort"), doc("", one_section_article("x"))});

  EXPECT_EQ(report.skipped, 2u);
  EXPECT_EQ(store_->document_count(), 0u);
}

TEST_F(IngestionServiceTest, UnchangedDocumentsAreNotReembedded) {
  auto document = doc("a", one_section_article("alpha"));
  service_->ingest({document});

  EXPECT_CALL(*gateway_, embed(_)).Times(0);
  auto report = service_->ingest({document});

  EXPECT_EQ(report.unchanged, 1u);
  EXPECT_EQ(report.processed, 0u);
  EXPECT_EQ(store_->chunk_count(), 1u);
}

TEST_F(IngestionServiceTest, ReingestingChangedDocumentDropsStaleChunks) {
  service_->ingest({doc("a", three_section_article("alpha"))});
  auto id = store_->find_document("a")->id;
  ASSERT_GT(store_->chunk_embeddings(id).size(), 1u);

  auto report = service_->ingest({doc("a", one_section_article("bravo"))});

  EXPECT_EQ(report.processed, 1u);
  EXPECT_EQ(store_->find_document("a")->id, id);
  EXPECT_EQ(store_->chunk_embeddings(id).size(), 1u);
  EXPECT_EQ(store_->get_document(id)->chunks[0].content.find("alpha"), std::string::npos);
}

TEST_F(IngestionServiceTest, TransientFailureMarksDocumentFailedAndContinues) {
  ON_CALL(*gateway_, embed(_))
      .WillByDefault([](const std::vector<std::string> &texts) -> std::vector<std::vector<float>> {
        if (mentions(texts, "bravo")) {
          throw CollaboratorError("503 unavailable", FailureKind::Transient);
        }
        return std::vector<std::vector<float>>(texts.size(), std::vector<float>(4, 0.2f));
      });

  auto report = service_->ingest(
      {doc("a", one_section_article("alpha")), doc("b", one_section_article("bravo")),
       doc("c", one_section_article("charlie"))});

  EXPECT_EQ(report.processed, 2u);
  EXPECT_EQ(report.failed, 1u);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].external_id, "b");
  EXPECT_FALSE(store_->find_document("b").has_value());
  EXPECT_TRUE(store_->find_document("c").has_value());
}

TEST_F(IngestionServiceTest, WrongVectorCountCountsAsFailure) {
  ON_CALL(*gateway_, embed(_)).WillByDefault(Return(std::vector<std::vector<float>>{}));

  auto report = service_->ingest({doc("a", one_section_article("alpha"))});

  EXPECT_EQ(report.failed, 1u);
  EXPECT_EQ(store_->document_count(), 0u);
}

TEST_F(IngestionServiceTest, FatalFailureAbortsTheRun) {
  ON_CALL(*gateway_, embed(_))
      .WillByDefault(Throw(CollaboratorError("401 unauthorized", FailureKind::Fatal)));

  EXPECT_THROW(service_->ingest({doc("a", one_section_article("alpha")),
                                 doc("b", one_section_article("bravo"))}),
               CollaboratorError);
  EXPECT_EQ(store_->document_count(), 0u);
}

TEST_F(IngestionServiceTest, CancellationStopsBetweenDocuments) {
  lens_core::CancellationToken cancel;
  ON_CALL(*gateway_, embed(_)).WillByDefault([&cancel](const std::vector<std::string> &texts) {
    cancel.cancel();
    return std::vector<std::vector<float>>(texts.size(), std::vector<float>(4, 0.3f));
  });

  auto report = service_->ingest(
      {doc("a", one_section_article("alpha")), doc("b", one_section_article("bravo"))}, &cancel);

  EXPECT_TRUE(report.cancelled);
  EXPECT_EQ(report.processed, 1u);
  EXPECT_TRUE(store_->find_document("a").has_value());
  EXPECT_FALSE(store_->find_document("b").has_value());
}

TEST_F(IngestionServiceTest, CancellationBetweenEmbedBatchesWritesNothing) {
  lens_core::CancellationToken cancel;
  ON_CALL(*gateway_, embed(_)).WillByDefault([&cancel](const std::vector<std::string> &texts) {
    cancel.cancel();
    return std::vector<std::vector<float>>(texts.size(), std::vector<float>(4, 0.3f));
  });
  EXPECT_CALL(*gateway_, embed(_)).Times(1);

  auto report = service_->ingest({doc("a", three_section_article("alpha"))}, &cancel);

  EXPECT_TRUE(report.cancelled);
  EXPECT_EQ(report.processed, 0u);
  EXPECT_EQ(store_->document_count(), 0u);
}

TEST_F(IngestionServiceTest, TransientStoreFailureIsRetried) {
  auto store = std::make_shared<MockVectorStore>();
  auto service = make_service(store);

  EXPECT_CALL(*store, find_document("a")).WillOnce(Return(std::nullopt));
  EXPECT_CALL(*store, upsert_document(_))
      .WillOnce(Throw(lens_core::VectorStoreError("database is locked", FailureKind::Transient)))
      .WillRepeatedly(Return(7));
  EXPECT_CALL(*store, upsert_chunks(7, _)).Times(1);
  EXPECT_CALL(*store, prune_chunks(7, 1u)).Times(1);

  auto report = service->ingest({doc("a", one_section_article("alpha"))});

  EXPECT_EQ(report.processed, 1u);
  EXPECT_EQ(sleeps_.size(), 1u);
}

TEST_F(IngestionServiceTest, StoredHashChangesOnlyAfterChunksAreWritten) {
  auto store = std::make_shared<MockVectorStore>();
  auto service = make_service(store);
  std::string content = one_section_article("alpha");
  std::string new_hash = lens_core::compute_content_hash(content);

  lens_core::DocumentSummary existing;
  existing.id = 3;
  existing.external_id = "a";
  existing.content_hash = "old-hash";
  existing.chunk_count = 4;
  EXPECT_CALL(*store, find_document("a")).WillOnce(Return(existing));

  {
    InSequence in_order;
    EXPECT_CALL(*store, upsert_document(Field(&lens_core::Document::content_hash, "old-hash")))
        .WillOnce(Return(3));
    EXPECT_CALL(*store, upsert_chunks(3, _));
    EXPECT_CALL(*store, prune_chunks(3, 1u));
    EXPECT_CALL(*store, upsert_document(Field(&lens_core::Document::content_hash, new_hash)))
        .WillOnce(Return(3));
  }

  auto report = service->ingest({doc("a", content)});

  EXPECT_EQ(report.processed, 1u);
}

TEST_F(IngestionServiceTest, RequiresCollaborators) {
  EXPECT_THROW(lens_core::IngestionService(nullptr, gateway_, chunker_,
                                           lens_core::RetryPolicy::no_retry()),
               lens_core::ConfigurationError);
  EXPECT_THROW(lens_core::IngestionService(store_, gateway_, chunker_,
                                           lens_core::RetryPolicy::no_retry(),
                                           lens_core::IngestionOptions{.embedding_batch_size = 0}),
               lens_core::ConfigurationError);
}

}  // namespace lens_tests
