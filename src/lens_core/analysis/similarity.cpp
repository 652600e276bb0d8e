#include "lens_core/analysis/similarity.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace lens_core {

namespace {

void check_dimensions(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size()) {
    throw std::invalid_argument("Vector dimension mismatch: " + std::to_string(a.size()) +
                                " vs " + std::to_string(b.size()));
  }
}

}  // namespace

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
  check_dimensions(a, b);
  // Accumulate in double
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0f;
  }
  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

double squared_euclidean_distance(const std::vector<float>& a, const std::vector<float>& b) {
  check_dimensions(a, b);
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    double diff = static_cast<double>(a[i]) - b[i];
    sum += diff * diff;
  }
  return sum;
}

std::vector<float> l2_normalized(const std::vector<float>& v) {
  double norm = 0.0;
  for (float val : v) {
    norm += static_cast<double>(val) * val;
  }
  std::vector<float> out(v);
  if (norm == 0.0) {
    return out;
  }
  norm = std::sqrt(norm);
  for (float& val : out) {
    val = static_cast<float>(val / norm);
  }
  return out;
}

bool ranks_before(const ScoredChunk& lhs, const ScoredChunk& rhs) {
  if (lhs.similarity != rhs.similarity) {
    return lhs.similarity > rhs.similarity;
  }
  if (lhs.document_id != rhs.document_id) {
    return lhs.document_id < rhs.document_id;
  }
  return lhs.chunk_index < rhs.chunk_index;
}

std::vector<size_t> ranked_positions(const std::vector<ScoredChunk>& hits,
                                     size_t match_count,
                                     float threshold,
                                     std::optional<DocumentId> exclude_document_id) {
  std::vector<size_t> positions;
  positions.reserve(hits.size());
  for (size_t i = 0; i < hits.size(); ++i) {
    const ScoredChunk& hit = hits[i];
    if (hit.similarity < threshold ||
        (exclude_document_id && hit.document_id == *exclude_document_id)) {
      continue;
    }
    positions.push_back(i);
  }
  std::sort(positions.begin(), positions.end(),
            [&](size_t lhs, size_t rhs) { return ranks_before(hits[lhs], hits[rhs]); });
  if (positions.size() > match_count) {
    positions.resize(match_count);
  }
  return positions;
}

void rank_and_filter(std::vector<ScoredChunk>& hits,
                     size_t match_count,
                     float threshold,
                     std::optional<DocumentId> exclude_document_id) {
  std::vector<size_t> positions =
      ranked_positions(hits, match_count, threshold, exclude_document_id);
  std::vector<ScoredChunk> ranked;
  ranked.reserve(positions.size());
  for (size_t position : positions) {
    ranked.push_back(std::move(hits[position]));
  }
  hits = std::move(ranked);
}

}  // namespace lens_core
