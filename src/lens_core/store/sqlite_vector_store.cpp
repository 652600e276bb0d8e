#include "lens_core/store/sqlite_vector_store.hpp"

#include <algorithm>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "lens_core/analysis/similarity.hpp"
#include "lens_core/db/pooled_connection.hpp"
#include "lens_core/db/sqlite_error_utils.hpp"
#include "lens_core/db/transaction.hpp"
#include "lens_core/store/text_codec.hpp"

namespace lens_core {

SqliteVectorStore::SqliteVectorStore(DatabaseManager &db_manager,
                                     size_t dimensions,
                                     size_t write_batch_size)
    : db_manager_(db_manager), dimensions_(dimensions), write_batch_size_(write_batch_size) {
  if (dimensions_ == 0) {
    throw ConfigurationError("SqliteVectorStore needs a positive vector dimension");
  }
  if (write_batch_size_ == 0) {
    throw ConfigurationError("SqliteVectorStore needs a positive write batch size");
  }
}

SqliteVectorStore::~SqliteVectorStore() = default;

void SqliteVectorStore::rethrow_db_error(const std::string &operation,
                                         const sqlite::sqlite_exception &e) const {
  throw VectorStoreError(format_db_error(operation, e),
                         failure_kind_for(classify_sqlite_code(e.get_code())));
}

std::string SqliteVectorStore::time_point_to_string(
    const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::string SqliteVectorStore::int_vector_to_comma_string(const std::vector<int64_t> &values) {
  std::stringstream ss;
  for (size_t i = 0; i < values.size(); ++i) {
    ss << values[i];
    if (i < values.size() - 1)
      ss << ",";
  }
  return ss.str();
}

void SqliteVectorStore::validate_vector_dimension(const std::vector<float> &vector) const {
  if (vector.size() != dimensions_) {
    throw VectorStoreError("Vector dimension mismatch. Expected " + std::to_string(dimensions_) +
                               ", got " + std::to_string(vector.size()),
                           FailureKind::InvalidInput);
  }
}

std::vector<char> SqliteVectorStore::vector_to_blob(const std::vector<float> &vector) const {
  std::vector<char> blob(vector.size() * sizeof(float));
  std::memcpy(blob.data(), vector.data(), blob.size());
  return blob;
}

std::vector<float> SqliteVectorStore::blob_to_vector(const std::vector<char> &blob) const {
  if (blob.size() != dimensions_ * sizeof(float)) {
    return {};
  }
  std::vector<float> vector(dimensions_);
  std::memcpy(vector.data(), blob.data(), blob.size());
  return vector;
}

/*
Upserts a document keyed by its external id. Re-ingesting the same document
updates it in place and keeps its id, so existing chunk rows stay attached.

@returns the id of the document
*/
DocumentId SqliteVectorStore::upsert_document(const Document &document) {
  if (document.external_id.empty()) {
    throw VectorStoreError("Document external id cannot be empty", FailureKind::InvalidInput);
  }
  try {
    std::string now = time_point_to_string(std::chrono::system_clock::now());
    std::vector<char> content_blob = TextCodec::encode(document.content);

    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    *conn << "INSERT INTO documents (external_id, title, url_slug, content, content_hash, "
             "created_at, updated_at) VALUES (?,?,?,?,?,?,?) "
             "ON CONFLICT(external_id) DO UPDATE SET title=excluded.title, "
             "url_slug=excluded.url_slug, content=excluded.content, "
             "content_hash=excluded.content_hash, updated_at=excluded.updated_at"
          << document.external_id << document.title << document.url_slug << content_blob
          << document.content_hash << now << now;

    int64_t id = -1;
    *conn << "SELECT id FROM documents WHERE external_id = ?" << document.external_id >>
        [&](int64_t row_id) { id = row_id; };
    tx.commit();

    if (id < 0) {
      throw VectorStoreError("Upsert of document '" + document.external_id + "' returned no id");
    }
    return id;
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("upsert_document", e);
  }
}

void SqliteVectorStore::upsert_chunks(DocumentId document_id, const std::vector<Chunk> &chunks) {
  if (chunks.empty())
    return;

  for (const auto &chunk : chunks) {
    validate_vector_dimension(chunk.vector_embedding);
  }

  // Small transactions keep each write well inside the busy timeout; a failed
  // batch can be retried without redoing the ones already committed.
  for (size_t start = 0; start < chunks.size(); start += write_batch_size_) {
    size_t stop = std::min(chunks.size(), start + write_batch_size_);
    write_chunk_batch(document_id, chunks.begin() + start, chunks.begin() + stop);
  }

  std::lock_guard<std::mutex> lock(index_mutex_);
  index_dirty_ = true;
}

void SqliteVectorStore::write_chunk_batch(DocumentId document_id,
                                          std::vector<Chunk>::const_iterator begin,
                                          std::vector<Chunk>::const_iterator end) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, TransactionMode::Immediate);

    bool exists = false;
    *conn << "SELECT 1 FROM documents WHERE id = ? LIMIT 1" << document_id >>
        [&](int /*dummy*/) { exists = true; };
    if (!exists) {
      throw VectorStoreError("Document with ID " + std::to_string(document_id) + " not found",
                             FailureKind::InvalidInput);
    }

    for (auto it = begin; it != end; ++it) {
      *conn << "INSERT INTO chunks (document_id, chunk_index, content, heading, token_count, "
               "vector_blob) VALUES (?, ?, ?, ?, ?, ?) "
               "ON CONFLICT(document_id, chunk_index) DO UPDATE SET content=excluded.content, "
               "heading=excluded.heading, token_count=excluded.token_count, "
               "vector_blob=excluded.vector_blob"
            << document_id << it->chunk_index << TextCodec::encode(it->content) << it->heading
            << static_cast<int64_t>(it->token_count) << vector_to_blob(it->vector_embedding);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("upsert_chunks", e);
  }
}

void SqliteVectorStore::prune_chunks(DocumentId document_id, size_t keep_count) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "DELETE FROM chunks WHERE document_id = ? AND chunk_index >= ?" << document_id
          << static_cast<int64_t>(keep_count);
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("prune_chunks", e);
  }
  std::lock_guard<std::mutex> lock(index_mutex_);
  index_dirty_ = true;
}

void SqliteVectorStore::rebuild_index() {
  std::lock_guard<std::mutex> lock(index_mutex_);
  index_dirty_ = true;
  ensure_index();
}

// Caller holds index_mutex_.
void SqliteVectorStore::ensure_index() {
  if (!index_dirty_ && faiss_index_) {
    return;
  }

  auto base_index = new faiss::IndexFlatIP(static_cast<faiss::idx_t>(dimensions_));
  auto index = std::make_unique<faiss::IndexIDMap>(base_index);
  index->own_fields = true;

  std::vector<faiss::idx_t> faiss_ids;
  std::vector<float> all_vectors_flat;
  std::unordered_map<int64_t, IndexedChunk> indexed;

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, document_id, chunk_index, vector_blob FROM chunks "
             "WHERE vector_blob IS NOT NULL ORDER BY document_id, chunk_index" >>
        [&](int64_t id, int64_t document_id, int chunk_index, std::vector<char> vector_blob) {
          std::vector<float> vector = blob_to_vector(vector_blob);
          if (vector.empty()) {
            std::cerr << "[VectorStore] Warning: Skipping chunk ID " << id
                      << " during index rebuild due to mismatched vector dimension. Expected "
                      << dimensions_ * sizeof(float) << " bytes, got " << vector_blob.size()
                      << " bytes." << std::endl;
            return;
          }
          std::vector<float> unit = l2_normalized(vector);
          faiss_ids.push_back(id);
          all_vectors_flat.insert(all_vectors_flat.end(), unit.begin(), unit.end());
          indexed[id] = {document_id, chunk_index};
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("rebuild_index", e);
  }

  if (!faiss_ids.empty()) {
    index->add_with_ids(static_cast<faiss::idx_t>(faiss_ids.size()), all_vectors_flat.data(),
                        faiss_ids.data());
  }

  faiss_index_ = std::move(index);
  indexed_chunks_ = std::move(indexed);
  index_dirty_ = false;
}

std::vector<ScoredChunk> SqliteVectorStore::similarity_query(
    const std::vector<float> &query_vector,
    size_t top_k,
    float threshold,
    std::optional<DocumentId> exclude_document_id) {
  validate_vector_dimension(query_vector);
  if (top_k == 0) {
    return {};
  }

  std::vector<ScoredChunk> hits;
  std::vector<int64_t> row_ids;
  {
    std::lock_guard<std::mutex> lock(index_mutex_);
    ensure_index();
    faiss::idx_t total = faiss_index_->ntotal;
    if (total == 0) {
      return {};
    }

    // Score every vector so that threshold, exclusion and tie order are exact
    std::vector<float> unit_query = l2_normalized(query_vector);
    std::vector<float> distances(static_cast<size_t>(total));
    std::vector<faiss::idx_t> labels(static_cast<size_t>(total));
    faiss_index_->search(1, unit_query.data(), total, distances.data(), labels.data());

    // FAISS labels are chunk row ids
    std::vector<ScoredChunk> candidates;
    std::vector<int64_t> candidate_rows;
    candidates.reserve(labels.size());
    candidate_rows.reserve(labels.size());
    for (size_t i = 0; i < labels.size(); ++i) {
      if (labels[i] == -1) {
        continue;
      }
      auto it = indexed_chunks_.find(labels[i]);
      if (it == indexed_chunks_.end()) {
        continue;
      }
      ScoredChunk hit;
      hit.document_id = it->second.document_id;
      hit.chunk_index = it->second.chunk_index;
      hit.similarity = distances[i];
      candidates.push_back(std::move(hit));
      candidate_rows.push_back(labels[i]);
    }

    std::vector<size_t> positions =
        ranked_positions(candidates, top_k, threshold, exclude_document_id);
    hits.reserve(positions.size());
    row_ids.reserve(positions.size());
    for (size_t position : positions) {
      hits.push_back(std::move(candidates[position]));
      row_ids.push_back(candidate_rows[position]);
    }
  }

  fill_chunk_metadata(hits, row_ids);
  return hits;
}

void SqliteVectorStore::fill_chunk_metadata(std::vector<ScoredChunk> &hits,
                                            const std::vector<int64_t> &row_ids) {
  if (hits.empty()) {
    return;
  }

  struct Metadata {
    std::string content;
    std::optional<std::string> heading;
    std::string title;
    std::string slug;
  };
  std::unordered_map<int64_t, Metadata> by_row;

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT c.id, c.content, c.heading, d.title, d.url_slug FROM chunks c "
             "JOIN documents d ON d.id = c.document_id WHERE c.id IN (" +
                 int_vector_to_comma_string(row_ids) + ")" >>
        [&](int64_t id, std::vector<char> content, std::optional<std::string> heading,
            std::string title, std::optional<std::string> slug) {
          by_row[id] = {TextCodec::decode(content), std::move(heading), std::move(title),
                        slug.value_or("")};
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("fill_chunk_metadata", e);
  }

  for (size_t i = 0; i < hits.size(); ++i) {
    auto it = by_row.find(row_ids[i]);
    if (it == by_row.end()) {
      std::cerr << "[VectorStore] Warning: chunk row " << row_ids[i]
                << " vanished between index build and metadata fetch." << std::endl;
      continue;
    }
    hits[i].content = std::move(it->second.content);
    hits[i].heading = std::move(it->second.heading);
    hits[i].document_title = std::move(it->second.title);
    hits[i].document_slug = std::move(it->second.slug);
  }
}

std::vector<std::vector<float>> SqliteVectorStore::chunk_embeddings(DocumentId document_id) {
  std::vector<std::vector<float>> embeddings;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT vector_blob FROM chunks WHERE document_id = ? AND vector_blob IS NOT NULL "
             "ORDER BY chunk_index"
          << document_id >>
        [&](std::vector<char> vector_blob) {
          std::vector<float> vector = blob_to_vector(vector_blob);
          if (!vector.empty()) {
            embeddings.push_back(std::move(vector));
          }
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("chunk_embeddings", e);
  }
  return embeddings;
}

void SqliteVectorStore::for_each_chunk_embedding(const ChunkVisitor &visitor) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT document_id, chunk_index, vector_blob FROM chunks "
             "WHERE vector_blob IS NOT NULL ORDER BY document_id, chunk_index" >>
        [&](int64_t document_id, int chunk_index, std::vector<char> vector_blob) {
          std::vector<float> vector = blob_to_vector(vector_blob);
          if (vector.empty()) {
            std::cerr << "[VectorStore] Warning: Skipping chunk " << document_id << ":"
                      << chunk_index << " with mismatched vector dimension." << std::endl;
            return;
          }
          visitor(document_id, chunk_index, vector);
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("for_each_chunk_embedding", e);
  }
}

std::vector<DocumentSummary> SqliteVectorStore::list_documents() {
  std::vector<DocumentSummary> documents;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT d.id, d.external_id, d.title, d.url_slug, d.content_hash, "
             "(SELECT COUNT(*) FROM chunks c WHERE c.document_id = d.id) "
             "FROM documents d ORDER BY d.id" >>
        [&](int64_t id, std::string external_id, std::string title,
            std::optional<std::string> url_slug, std::string content_hash, int64_t chunks) {
          documents.push_back({.id = id,
                               .external_id = std::move(external_id),
                               .title = std::move(title),
                               .url_slug = url_slug.value_or(""),
                               .content_hash = std::move(content_hash),
                               .chunk_count = static_cast<size_t>(chunks)});
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("list_documents", e);
  }
  return documents;
}

std::optional<Document> SqliteVectorStore::get_document(DocumentId document_id) {
  try {
    std::optional<Document> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, external_id, title, url_slug, content, content_hash FROM documents "
             "WHERE id = ?"
          << document_id >>
        [&](int64_t id, std::string external_id, std::string title,
            std::optional<std::string> url_slug, std::optional<std::vector<char>> content,
            std::string content_hash) {
          Document document;
          document.id = id;
          document.external_id = std::move(external_id);
          document.title = std::move(title);
          document.url_slug = url_slug.value_or("");
          if (content) {
            document.content = TextCodec::decode(*content);
          }
          document.content_hash = std::move(content_hash);
          result = std::move(document);
        };
    if (!result) {
      return std::nullopt;
    }

    *conn << "SELECT chunk_index, content, heading, token_count, vector_blob FROM chunks "
             "WHERE document_id = ? ORDER BY chunk_index"
          << document_id >>
        [&](int chunk_index, std::vector<char> content, std::optional<std::string> heading,
            int64_t token_count, std::optional<std::vector<char>> vector_blob) {
          Chunk chunk;
          chunk.chunk_index = chunk_index;
          chunk.content = TextCodec::decode(content);
          chunk.heading = std::move(heading);
          chunk.token_count = static_cast<size_t>(token_count);
          if (vector_blob) {
            chunk.vector_embedding = blob_to_vector(*vector_blob);
          }
          result->chunks.push_back(std::move(chunk));
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("get_document", e);
  }
}

std::optional<DocumentSummary> SqliteVectorStore::find_document(const std::string &external_id) {
  try {
    std::optional<DocumentSummary> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT d.id, d.external_id, d.title, d.url_slug, d.content_hash, "
             "(SELECT COUNT(*) FROM chunks c WHERE c.document_id = d.id) "
             "FROM documents d WHERE d.external_id = ?"
          << external_id >>
        [&](int64_t id, std::string ext_id, std::string title,
            std::optional<std::string> url_slug, std::string content_hash, int64_t chunks) {
          result = DocumentSummary{.id = id,
                                   .external_id = std::move(ext_id),
                                   .title = std::move(title),
                                   .url_slug = url_slug.value_or(""),
                                   .content_hash = std::move(content_hash),
                                   .chunk_count = static_cast<size_t>(chunks)};
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("find_document", e);
  }
}

size_t SqliteVectorStore::document_count() {
  try {
    PooledConnection conn(db_manager_);
    int64_t count = 0;
    *conn << "SELECT COUNT(*) FROM documents" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("document_count", e);
  }
}

size_t SqliteVectorStore::chunk_count() {
  try {
    PooledConnection conn(db_manager_);
    int64_t count = 0;
    *conn << "SELECT COUNT(*) FROM chunks" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("chunk_count", e);
  }
}

}  // namespace lens_core
