#pragma once

#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "lens_core/analysis/document_aggregator.hpp"
#include "lens_core/errors.hpp"

namespace lens_core {

struct ClusterOptions {
  uint64_t seed = 42;
  int restarts = 10;
  int max_iterations = 300;
};

struct ClusteringResult {
  std::map<DocumentId, int> assignment;      // every document -> id in [0, k)
  std::vector<std::vector<float>> centroids;  // k centroids, index is the cluster id
  double inertia = 0.0;                      // within-cluster sum of squared distances
  int iterations = 0;                        // Lloyd iterations of the winning restart
};

/**
 * @brief Seeded k-means over document embeddings.
 *
 * Each restart seeds with k-means++ from std::mt19937_64(seed + restart) and
 * runs Lloyd iterations until the assignment is stable or max_iterations is
 * reached. The restart with the lowest inertia wins, the earliest on ties.
 * Identical input, k and options always give identical results.
 */
class ClusterEngine {
 public:
  explicit ClusterEngine(ClusterOptions options = {});

  // Throws ConfigurationError for k == 0, k > number of documents, empty input
  // or embeddings of differing dimensions. Nothing is computed in that case.
  ClusteringResult cluster(const DocumentEmbeddings &embeddings, size_t k) const;

  // Member display keys per cluster id (documents in ascending id order).
  // Every id in [0, k) is present. Documents without a key use their id.
  static std::map<int, std::vector<std::string>> members_by_cluster(
      const ClusteringResult &result, const std::map<DocumentId, std::string> &display_keys);

  const ClusterOptions &options() const {
    return options_;
  }

 private:
  struct Run {
    std::vector<int> assignment;
    std::vector<double> centroids;  // k * dim, row-major
    double inertia = 0.0;
    int iterations = 0;
  };

  Run run_once(const std::vector<float> &points, size_t n, size_t dim, size_t k,
               std::mt19937_64 &rng) const;

  ClusterOptions options_;
};

}  // namespace lens_core
