#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lens_core/errors.hpp"
#include "lens_core/types/chunk.hpp"
#include "lens_core/types/document.hpp"
#include "lens_core/types/retrieval_result.hpp"

namespace lens_core {

class VectorStoreError : public CollaboratorError {
 public:
  explicit VectorStoreError(const std::string &message, FailureKind kind = FailureKind::Fatal)
      : CollaboratorError(message, kind) {}
};

/**
 * @brief Persistence contract for documents, chunks and chunk vectors.
 *
 * Implementations may scan or use an index, but similarity_query must return
 * what an exact brute-force cosine scan would: no hit below the threshold, no
 * hit from the excluded document, similarity descending with ties broken by
 * ascending (document_id, chunk_index), at most top_k hits.
 */
class VectorStore {
 public:
  using ChunkVisitor =
      std::function<void(DocumentId document_id, int chunk_index, const std::vector<float> &)>;

  virtual ~VectorStore() = default;

  // Insert or update keyed by Document::external_id. Returns the store's id.
  virtual DocumentId upsert_document(const Document &document) = 0;

  // Insert or overwrite keyed by (document_id, chunk_index).
  virtual void upsert_chunks(DocumentId document_id, const std::vector<Chunk> &chunks) = 0;

  // Drops chunks with chunk_index >= keep_count.
  virtual void prune_chunks(DocumentId document_id, size_t keep_count) = 0;

  virtual std::vector<ScoredChunk> similarity_query(
      const std::vector<float> &query_vector,
      size_t top_k,
      float threshold,
      std::optional<DocumentId> exclude_document_id) = 0;

  // Embeddings of one document's chunks in chunk_index order.
  virtual std::vector<std::vector<float>> chunk_embeddings(DocumentId document_id) = 0;

  // Streams every stored chunk embedding in ascending (document_id, chunk_index) order.
  virtual void for_each_chunk_embedding(const ChunkVisitor &visitor) = 0;

  virtual std::vector<DocumentSummary> list_documents() = 0;
  virtual std::optional<Document> get_document(DocumentId document_id) = 0;
  virtual std::optional<DocumentSummary> find_document(const std::string &external_id) = 0;

  virtual size_t document_count() = 0;
  virtual size_t chunk_count() = 0;
};

using VectorStorePtr = std::shared_ptr<VectorStore>;

}  // namespace lens_core
