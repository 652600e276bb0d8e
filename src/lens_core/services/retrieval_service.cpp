#include "lens_core/services/retrieval_service.hpp"

#include <unordered_map>
#include <unordered_set>
#include <utf8.h>

#include "lens_core/analysis/similarity.hpp"
#include "lens_core/chunking/markdown_chunker.hpp"

namespace lens_core {

namespace {

void validate_query_options(size_t match_count, float similarity_threshold) {
  if (match_count == 0) {
    throw ConfigurationError("match_count must be greater than 0");
  }
  if (similarity_threshold < -1.0f || similarity_threshold > 1.0f) {
    throw ConfigurationError("similarity_threshold must be within [-1, 1]");
  }
}

}  // namespace

std::string truncate_utf8(const std::string &text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  auto it = text.begin();
  auto end_of_prefix = text.begin();
  while (it != text.end()) {
    auto next = it;
    try {
      utf8::next(next, text.end());
    } catch (const utf8::exception &) {
      // Stop before an invalid sequence rather than split it
      break;
    }
    if (static_cast<size_t>(next - text.begin()) > max_bytes) {
      break;
    }
    it = next;
    end_of_prefix = next;
  }
  return std::string(text.begin(), end_of_prefix);
}

RetrievalService::RetrievalService(VectorStorePtr vector_store,
                                   EmbeddingGatewayPtr embedding_gateway)
    : vector_store_(std::move(vector_store)), embedding_gateway_(std::move(embedding_gateway)) {
  if (!vector_store_ || !embedding_gateway_) {
    throw ConfigurationError("RetrievalService requires a vector store and an embedding gateway");
  }
}

std::vector<ScoredChunk> RetrievalService::retrieve(const std::string &query_text,
                                                    size_t match_count,
                                                    float similarity_threshold,
                                                    std::optional<DocumentId> exclude_document_id) {
  validate_query_options(match_count, similarity_threshold);
  if (strip(query_text).empty()) {
    throw ConfigurationError("Query text cannot be empty");
  }
  std::vector<float> query_vector = embedding_gateway_->embed_one(query_text);
  return query(query_vector, match_count, similarity_threshold, exclude_document_id);
}

std::vector<ScoredChunk> RetrievalService::query(const std::vector<float> &query_vector,
                                                 size_t match_count,
                                                 float similarity_threshold,
                                                 std::optional<DocumentId> exclude_document_id) {
  std::vector<ScoredChunk> hits = vector_store_->similarity_query(
      query_vector, match_count, similarity_threshold, exclude_document_id);
  // Ranking and filtering hold for every store implementation
  rank_and_filter(hits, match_count, similarity_threshold, exclude_document_id);
  return hits;
}

std::vector<LinkSuggestion> RetrievalService::suggest_links(DocumentId document_id,
                                                            size_t match_count,
                                                            float similarity_threshold,
                                                            size_t max_links) {
  validate_query_options(match_count, similarity_threshold);
  if (max_links == 0) {
    throw ConfigurationError("max_links must be greater than 0");
  }

  auto document = vector_store_->get_document(document_id);
  if (!document) {
    throw ConfigurationError("Document " + std::to_string(document_id) + " does not exist");
  }
  if (strip(document->content).empty()) {
    return {};
  }

  std::vector<float> query_vector = embedding_gateway_->embed_one(document->content);
  std::vector<ScoredChunk> hits =
      query(query_vector, match_count, similarity_threshold, document_id);

  std::vector<LinkSuggestion> suggestions;
  std::unordered_set<DocumentId> seen;
  for (const auto &hit : hits) {
    if (!seen.insert(hit.document_id).second) {
      continue;
    }
    suggestions.push_back({.document_id = hit.document_id,
                           .title = hit.document_title,
                           .url_slug = hit.document_slug,
                           .best_chunk = hit});
    if (suggestions.size() == max_links) {
      break;
    }
  }
  return suggestions;
}

std::vector<DocumentExcerpts> RetrievalService::group_by_document(
    const std::vector<ScoredChunk> &results,
    size_t max_excerpts_per_document,
    size_t max_excerpt_bytes) {
  std::vector<DocumentExcerpts> groups;
  std::unordered_map<DocumentId, size_t> position;

  for (const auto &hit : results) {
    auto [it, inserted] = position.try_emplace(hit.document_id, groups.size());
    if (inserted) {
      groups.push_back({.document_id = hit.document_id,
                        .title = hit.document_title,
                        .url_slug = hit.document_slug,
                        .best_similarity = hit.similarity,
                        .excerpts = {}});
    }
    DocumentExcerpts &group = groups[it->second];
    if (hit.similarity > group.best_similarity) {
      group.best_similarity = hit.similarity;
    }
    if (group.excerpts.size() < max_excerpts_per_document) {
      group.excerpts.push_back(truncate_utf8(hit.content, max_excerpt_bytes));
    }
  }
  return groups;
}

}  // namespace lens_core
