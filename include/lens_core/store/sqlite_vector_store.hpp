#pragma once

#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <sqlite_modern_cpp.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "lens_core/db/database_manager.hpp"
#include "lens_core/store/vector_store.hpp"

namespace lens_core {

/**
 * @brief VectorStore persisted in (optionally SQLCipher-encrypted) SQLite.
 *
 * Chunk text is zstd-compressed, vectors are stored as float32 blobs.
 * Similarity queries run against an in-memory Faiss IndexFlatIP over
 * L2-normalized chunk vectors, which is an exact cosine scan. The index is
 * rebuilt lazily on the first query after any write.
 */
class SqliteVectorStore : public VectorStore {
 public:
  SqliteVectorStore(DatabaseManager &db_manager, size_t dimensions, size_t write_batch_size = 5);
  ~SqliteVectorStore() override;

  SqliteVectorStore(const SqliteVectorStore &) = delete;
  SqliteVectorStore &operator=(const SqliteVectorStore &) = delete;

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

  // Forces the Faiss index to be rebuilt from the database now.
  void rebuild_index();

 private:
  struct IndexedChunk {
    DocumentId document_id;
    int chunk_index;
  };

  void ensure_index();
  void validate_vector_dimension(const std::vector<float> &vector) const;
  void write_chunk_batch(DocumentId document_id,
                         std::vector<Chunk>::const_iterator begin,
                         std::vector<Chunk>::const_iterator end);
  void fill_chunk_metadata(std::vector<ScoredChunk> &hits, const std::vector<int64_t> &row_ids);
  [[noreturn]] void rethrow_db_error(const std::string &operation,
                                     const sqlite::sqlite_exception &e) const;

  std::vector<char> vector_to_blob(const std::vector<float> &vector) const;
  std::vector<float> blob_to_vector(const std::vector<char> &blob) const;
  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::string int_vector_to_comma_string(const std::vector<int64_t> &values);

  DatabaseManager &db_manager_;  // non-owning
  size_t dimensions_;
  size_t write_batch_size_;

  std::mutex index_mutex_;
  std::unique_ptr<faiss::IndexIDMap> faiss_index_;
  std::unordered_map<int64_t, IndexedChunk> indexed_chunks_;
  bool index_dirty_ = true;
};

}  // namespace lens_core
