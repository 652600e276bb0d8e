#pragma once

#include <optional>
#include <vector>

#include "lens_core/types/retrieval_result.hpp"

namespace lens_core {

// Cosine similarity; 0 when either vector has zero magnitude.
// Throws std::invalid_argument on dimension mismatch.
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

double squared_euclidean_distance(const std::vector<float>& a, const std::vector<float>& b);

// Returns a unit-length copy; a zero vector stays zero.
std::vector<float> l2_normalized(const std::vector<float>& v);

// Canonical result order: similarity descending, then (document_id, chunk_index) ascending.
bool ranks_before(const ScoredChunk& lhs, const ScoredChunk& rhs);

// Positions of the hits that survive the threshold and exclusion, in canonical order,
// at most `match_count` of them. `hits` is left untouched.
std::vector<size_t> ranked_positions(const std::vector<ScoredChunk>& hits,
                                     size_t match_count,
                                     float threshold,
                                     std::optional<DocumentId> exclude_document_id);

// Drops hits below `threshold` or owned by `exclude_document_id`, sorts them into the
// canonical order and keeps at most `match_count`.
void rank_and_filter(std::vector<ScoredChunk>& hits,
                     size_t match_count,
                     float threshold,
                     std::optional<DocumentId> exclude_document_id);

}  // namespace lens_core
