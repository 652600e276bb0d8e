#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lens_core/llm/embedding_gateway.hpp"
#include "lens_core/store/vector_store.hpp"
#include "lens_core/types/retrieval_result.hpp"

namespace lens_core {

// A linkable target document with the chunk that matched best.
struct LinkSuggestion {
  DocumentId document_id = 0;
  std::string title;
  std::string url_slug;
  ScoredChunk best_chunk;
};

// Retrieval hits of one document, in the order the document first appeared.
struct DocumentExcerpts {
  DocumentId document_id = 0;
  std::string title;
  std::string url_slug;
  float best_similarity = 0.0f;
  std::vector<std::string> excerpts;
};

class RetrievalService {
 public:
  RetrievalService(VectorStorePtr vector_store, EmbeddingGatewayPtr embedding_gateway);

  // Embeds the query and returns at most match_count chunks with similarity >=
  // similarity_threshold, best first, ties by (document_id, chunk_index).
  std::vector<ScoredChunk> retrieve(const std::string &query_text,
                                    size_t match_count,
                                    float similarity_threshold,
                                    std::optional<DocumentId> exclude_document_id = std::nullopt);

  // Other documents worth linking from `document_id`, at most max_links, best first.
  std::vector<LinkSuggestion> suggest_links(DocumentId document_id,
                                            size_t match_count,
                                            float similarity_threshold,
                                            size_t max_links);

  static std::vector<DocumentExcerpts> group_by_document(const std::vector<ScoredChunk> &results,
                                                         size_t max_excerpts_per_document = 3,
                                                         size_t max_excerpt_bytes = 600);

 private:
  std::vector<ScoredChunk> query(const std::vector<float> &query_vector,
                                 size_t match_count,
                                 float similarity_threshold,
                                 std::optional<DocumentId> exclude_document_id);

  VectorStorePtr vector_store_;
  EmbeddingGatewayPtr embedding_gateway_;
};

// Longest prefix of `text` no longer than max_bytes that ends on a UTF-8 boundary.
std::string truncate_utf8(const std::string &text, size_t max_bytes);

}  // namespace lens_core
