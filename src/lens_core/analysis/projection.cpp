#include "lens_core/analysis/projection.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

namespace lens_core {

namespace {

constexpr int MAX_POWER_ITERATIONS = 200;
constexpr double CONVERGENCE_EPSILON = 1e-10;

double norm(const std::vector<double> &v) {
  double total = 0.0;
  for (double x : v) {
    total += x * x;
  }
  return std::sqrt(total);
}

void remove_component(std::vector<double> &v, const std::vector<double> &unit) {
  double dot = 0.0;
  for (size_t d = 0; d < v.size(); ++d) {
    dot += v[d] * unit[d];
  }
  for (size_t d = 0; d < v.size(); ++d) {
    v[d] -= dot * unit[d];
  }
}

// Leading eigenvector of X^T X (X is n x dim, centered), orthogonal to `exclude`.
// Returns a zero vector when the remaining variance is zero.
std::vector<double> principal_axis(const std::vector<double> &centered, size_t n, size_t dim,
                                   const std::vector<double> *exclude, std::mt19937_64 &rng) {
  std::uniform_real_distribution<double> start(-1.0, 1.0);
  std::vector<double> axis(dim);
  for (auto &x : axis) {
    x = start(rng);
  }
  if (exclude) {
    remove_component(axis, *exclude);
  }
  double length = norm(axis);
  if (length == 0.0) {
    return std::vector<double>(dim, 0.0);
  }
  for (auto &x : axis) {
    x /= length;
  }

  std::vector<double> projected(n);
  std::vector<double> next(dim);
  for (int iteration = 0; iteration < MAX_POWER_ITERATIONS; ++iteration) {
    for (size_t i = 0; i < n; ++i) {
      double dot = 0.0;
      for (size_t d = 0; d < dim; ++d) {
        dot += centered[i * dim + d] * axis[d];
      }
      projected[i] = dot;
    }
    std::fill(next.begin(), next.end(), 0.0);
    for (size_t i = 0; i < n; ++i) {
      for (size_t d = 0; d < dim; ++d) {
        next[d] += centered[i * dim + d] * projected[i];
      }
    }
    if (exclude) {
      remove_component(next, *exclude);
    }

    length = norm(next);
    if (length < CONVERGENCE_EPSILON) {
      return std::vector<double>(dim, 0.0);
    }
    double delta = 0.0;
    for (size_t d = 0; d < dim; ++d) {
      next[d] /= length;
      delta += std::abs(next[d] - axis[d]);
    }
    axis.swap(next);
    if (delta < CONVERGENCE_EPSILON) {
      break;
    }
  }

  // Fix the sign so the largest component is positive
  size_t largest = 0;
  for (size_t d = 1; d < dim; ++d) {
    if (std::abs(axis[d]) > std::abs(axis[largest])) {
      largest = d;
    }
  }
  if (axis[largest] < 0.0) {
    for (auto &x : axis) {
      x = -x;
    }
  }
  return axis;
}

}  // namespace

std::map<DocumentId, Point2D> project_2d(const DocumentEmbeddings &embeddings, uint64_t seed) {
  std::map<DocumentId, Point2D> points;
  if (embeddings.empty()) {
    return points;
  }

  const size_t n = embeddings.size();
  const size_t dim = embeddings.begin()->second.size();
  std::vector<double> mean(dim, 0.0);
  for (const auto &[document_id, embedding] : embeddings) {
    if (embedding.size() != dim) {
      throw ConfigurationError("Document " + std::to_string(document_id) +
                               " has a different embedding dimension");
    }
    for (size_t d = 0; d < dim; ++d) {
      mean[d] += embedding[d];
    }
  }
  for (auto &x : mean) {
    x /= static_cast<double>(n);
  }

  std::vector<double> centered;
  centered.reserve(n * dim);
  for (const auto &[document_id, embedding] : embeddings) {
    for (size_t d = 0; d < dim; ++d) {
      centered.push_back(embedding[d] - mean[d]);
    }
  }

  std::mt19937_64 rng(seed);
  std::vector<double> first = principal_axis(centered, n, dim, nullptr, rng);
  std::vector<double> second = principal_axis(centered, n, dim, &first, rng);

  size_t row = 0;
  for (const auto &[document_id, embedding] : embeddings) {
    Point2D point;
    for (size_t d = 0; d < dim; ++d) {
      point.x += centered[row * dim + d] * first[d];
      point.y += centered[row * dim + d] * second[d];
    }
    points[document_id] = point;
    ++row;
  }
  return points;
}

}  // namespace lens_core
