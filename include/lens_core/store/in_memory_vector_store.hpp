#pragma once

#include <map>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include "lens_core/store/vector_store.hpp"

namespace lens_core {

// Exact brute-force store kept entirely in memory. Reference implementation of
// the VectorStore contract; also backs tests and small corpora.
class InMemoryVectorStore : public VectorStore {
 public:
  explicit InMemoryVectorStore(size_t dimensions = 0);

  DocumentId upsert_document(const Document &document) override;
  void upsert_chunks(DocumentId document_id, const std::vector<Chunk> &chunks) override;
  void prune_chunks(DocumentId document_id, size_t keep_count) override;

  std::vector<ScoredChunk> similarity_query(const std::vector<float> &query_vector,
                                            size_t top_k,
                                            float threshold,
                                            std::optional<DocumentId> exclude_document_id) override;

  std::vector<std::vector<float>> chunk_embeddings(DocumentId document_id) override;
  void for_each_chunk_embedding(const ChunkVisitor &visitor) override;

  std::vector<DocumentSummary> list_documents() override;
  std::optional<Document> get_document(DocumentId document_id) override;
  std::optional<DocumentSummary> find_document(const std::string &external_id) override;

  size_t document_count() override;
  size_t chunk_count() override;

 private:
  using ChunkKey = std::pair<DocumentId, int>;

  void validate_vector_dimension(const std::vector<float> &vector) const;
  size_t chunk_count_for(DocumentId document_id) const;
  DocumentSummary summarize(const Document &document) const;

  size_t dimensions_;
  DocumentId next_id_ = 1;
  std::map<DocumentId, Document> documents_;  // chunks held separately in chunks_
  std::unordered_map<std::string, DocumentId> ids_by_external_id_;
  std::map<ChunkKey, Chunk> chunks_;
  mutable std::shared_mutex mutex_;
};

}  // namespace lens_core
