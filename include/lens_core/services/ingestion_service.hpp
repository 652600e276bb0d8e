#pragma once

#include <memory>
#include <string>
#include <vector>

#include "lens_core/cancellation.hpp"
#include "lens_core/chunking/markdown_chunker.hpp"
#include "lens_core/llm/embedding_gateway.hpp"
#include "lens_core/retry_policy.hpp"
#include "lens_core/store/vector_store.hpp"

namespace lens_core {

struct IngestionFailure {
  std::string external_id;
  std::string reason;
};

struct IngestionReport {
  size_t processed = 0;
  size_t skipped = 0;
  size_t failed = 0;
  size_t unchanged = 0;
  size_t chunks_written = 0;
  bool cancelled = false;
  std::vector<IngestionFailure> failures;
};

struct IngestionOptions {
  size_t min_document_bytes = 100;
  size_t embedding_batch_size = 100;
};

/**
 * @brief Chunks, embeds and stores documents.
 *
 * Failures are isolated per document: a transient collaborator failure that
 * survives the retry policy marks that document failed and the batch goes on.
 * A fatal collaborator failure aborts the whole run. Everything written before
 * a failure or a cancellation stays valid; re-running resumes idempotently.
 */
class IngestionService {
 public:
  IngestionService(VectorStorePtr vector_store,
                   EmbeddingGatewayPtr embedding_gateway,
                   std::shared_ptr<const MarkdownChunker> chunker,
                   RetryPolicy retry_policy,
                   IngestionOptions options = {});

  IngestionReport ingest(const std::vector<Document> &documents,
                         const CancellationToken *cancel = nullptr);

 private:
  enum class Outcome { Processed, Skipped, Unchanged, Cancelled };

  Outcome ingest_one(const Document &document, IngestionReport &report,
                     const CancellationToken *cancel);

  VectorStorePtr vector_store_;
  EmbeddingGatewayPtr embedding_gateway_;
  std::shared_ptr<const MarkdownChunker> chunker_;
  RetryPolicy retry_policy_;
  IngestionOptions options_;
};

}  // namespace lens_core
