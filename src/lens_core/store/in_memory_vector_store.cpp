#include "lens_core/store/in_memory_vector_store.hpp"

#include <iterator>
#include <mutex>

#include "lens_core/analysis/similarity.hpp"

namespace lens_core {

InMemoryVectorStore::InMemoryVectorStore(size_t dimensions) : dimensions_(dimensions) {}

void InMemoryVectorStore::validate_vector_dimension(const std::vector<float> &vector) const {
  if (dimensions_ != 0 && vector.size() != dimensions_) {
    throw VectorStoreError("Vector dimension mismatch. Expected " + std::to_string(dimensions_) +
                               ", got " + std::to_string(vector.size()),
                           FailureKind::InvalidInput);
  }
}

DocumentId InMemoryVectorStore::upsert_document(const Document &document) {
  if (document.external_id.empty()) {
    throw VectorStoreError("Document external id cannot be empty", FailureKind::InvalidInput);
  }
  std::unique_lock lock(mutex_);

  DocumentId id;
  auto existing = ids_by_external_id_.find(document.external_id);
  if (existing != ids_by_external_id_.end()) {
    id = existing->second;
  } else {
    id = next_id_++;
    ids_by_external_id_[document.external_id] = id;
  }

  Document stored = document;
  stored.id = id;
  stored.chunks.clear();
  documents_[id] = std::move(stored);
  return id;
}

void InMemoryVectorStore::upsert_chunks(DocumentId document_id, const std::vector<Chunk> &chunks) {
  for (const auto &chunk : chunks) {
    validate_vector_dimension(chunk.vector_embedding);
  }
  std::unique_lock lock(mutex_);
  if (documents_.find(document_id) == documents_.end()) {
    throw VectorStoreError("Document with ID " + std::to_string(document_id) + " not found",
                           FailureKind::InvalidInput);
  }
  for (const auto &chunk : chunks) {
    chunks_[{document_id, chunk.chunk_index}] = chunk;
  }
}

void InMemoryVectorStore::prune_chunks(DocumentId document_id, size_t keep_count) {
  std::unique_lock lock(mutex_);
  auto it = chunks_.lower_bound({document_id, static_cast<int>(keep_count)});
  auto end = chunks_.lower_bound({document_id + 1, 0});
  chunks_.erase(it, end);
}

std::vector<ScoredChunk> InMemoryVectorStore::similarity_query(
    const std::vector<float> &query_vector,
    size_t top_k,
    float threshold,
    std::optional<DocumentId> exclude_document_id) {
  validate_vector_dimension(query_vector);
  std::shared_lock lock(mutex_);

  std::vector<ScoredChunk> hits;
  for (const auto &[key, chunk] : chunks_) {
    if (exclude_document_id && key.first == *exclude_document_id) {
      continue;
    }
    if (chunk.vector_embedding.size() != query_vector.size()) {
      continue;
    }
    float similarity = cosine_similarity(query_vector, chunk.vector_embedding);
    if (similarity < threshold) {
      continue;
    }
    const Document &owner = documents_.at(key.first);
    hits.push_back({.document_id = key.first,
                    .chunk_index = key.second,
                    .content = chunk.content,
                    .heading = chunk.heading,
                    .document_title = owner.title,
                    .document_slug = owner.url_slug,
                    .similarity = similarity});
  }
  rank_and_filter(hits, top_k, threshold, exclude_document_id);
  return hits;
}

std::vector<std::vector<float>> InMemoryVectorStore::chunk_embeddings(DocumentId document_id) {
  std::shared_lock lock(mutex_);
  std::vector<std::vector<float>> embeddings;
  auto it = chunks_.lower_bound({document_id, 0});
  for (; it != chunks_.end() && it->first.first == document_id; ++it) {
    embeddings.push_back(it->second.vector_embedding);
  }
  return embeddings;
}

void InMemoryVectorStore::for_each_chunk_embedding(const ChunkVisitor &visitor) {
  std::shared_lock lock(mutex_);
  for (const auto &[key, chunk] : chunks_) {
    visitor(key.first, key.second, chunk.vector_embedding);
  }
}

size_t InMemoryVectorStore::chunk_count_for(DocumentId document_id) const {
  auto it = chunks_.lower_bound({document_id, 0});
  auto end = chunks_.lower_bound({document_id + 1, 0});
  return static_cast<size_t>(std::distance(it, end));
}

DocumentSummary InMemoryVectorStore::summarize(const Document &document) const {
  return {.id = document.id,
          .external_id = document.external_id,
          .title = document.title,
          .url_slug = document.url_slug,
          .content_hash = document.content_hash,
          .chunk_count = chunk_count_for(document.id)};
}

std::vector<DocumentSummary> InMemoryVectorStore::list_documents() {
  std::shared_lock lock(mutex_);
  std::vector<DocumentSummary> summaries;
  summaries.reserve(documents_.size());
  for (const auto &[id, document] : documents_) {
    summaries.push_back(summarize(document));
  }
  return summaries;
}

std::optional<Document> InMemoryVectorStore::get_document(DocumentId document_id) {
  std::shared_lock lock(mutex_);
  auto it = documents_.find(document_id);
  if (it == documents_.end()) {
    return std::nullopt;
  }
  Document document = it->second;
  auto chunk_it = chunks_.lower_bound({document_id, 0});
  for (; chunk_it != chunks_.end() && chunk_it->first.first == document_id; ++chunk_it) {
    document.chunks.push_back(chunk_it->second);
  }
  return document;
}

std::optional<DocumentSummary> InMemoryVectorStore::find_document(const std::string &external_id) {
  std::shared_lock lock(mutex_);
  auto it = ids_by_external_id_.find(external_id);
  if (it == ids_by_external_id_.end()) {
    return std::nullopt;
  }
  return summarize(documents_.at(it->second));
}

size_t InMemoryVectorStore::document_count() {
  std::shared_lock lock(mutex_);
  return documents_.size();
}

size_t InMemoryVectorStore::chunk_count() {
  std::shared_lock lock(mutex_);
  return chunks_.size();
}

}  // namespace lens_core
