#include "lens_core/analysis/cluster_engine.hpp"

#include <algorithm>
#include <limits>

namespace lens_core {

namespace {

double distance_sq(const float *point, const double *centroid, size_t dim) {
  double total = 0.0;
  for (size_t d = 0; d < dim; ++d) {
    double diff = static_cast<double>(point[d]) - centroid[d];
    total += diff * diff;
  }
  return total;
}

// Nearest centroid; the lowest cluster id wins exact ties.
std::pair<int, double> nearest_centroid(const float *point, const std::vector<double> &centroids,
                                        size_t k, size_t dim) {
  int best = 0;
  double best_dist = std::numeric_limits<double>::max();
  for (size_t c = 0; c < k; ++c) {
    double dist = distance_sq(point, centroids.data() + c * dim, dim);
    if (dist < best_dist) {
      best_dist = dist;
      best = static_cast<int>(c);
    }
  }
  return {best, best_dist};
}

void set_centroid(std::vector<double> &centroids, size_t c, const float *point, size_t dim) {
  for (size_t d = 0; d < dim; ++d) {
    centroids[c * dim + d] = point[d];
  }
}

}  // namespace

ClusterEngine::ClusterEngine(ClusterOptions options) : options_(options) {
  if (options_.restarts < 1) {
    throw ConfigurationError("restarts must be at least 1");
  }
  if (options_.max_iterations < 1) {
    throw ConfigurationError("max_iterations must be at least 1");
  }
}

ClusteringResult ClusterEngine::cluster(const DocumentEmbeddings &embeddings, size_t k) const {
  if (embeddings.empty()) {
    throw ConfigurationError("Cannot cluster an empty document set");
  }
  if (k == 0) {
    throw ConfigurationError("Cluster count must be greater than 0");
  }
  if (k > embeddings.size()) {
    throw ConfigurationError("Cluster count " + std::to_string(k) + " exceeds document count " +
                             std::to_string(embeddings.size()));
  }

  const size_t n = embeddings.size();
  const size_t dim = embeddings.begin()->second.size();
  if (dim == 0) {
    throw ConfigurationError("Document embeddings must not be empty vectors");
  }

  std::vector<DocumentId> ids;
  std::vector<float> points;
  ids.reserve(n);
  points.reserve(n * dim);
  for (const auto &[document_id, embedding] : embeddings) {
    if (embedding.size() != dim) {
      throw ConfigurationError("Document " + std::to_string(document_id) + " has dimension " +
                               std::to_string(embedding.size()) + ", expected " +
                               std::to_string(dim));
    }
    ids.push_back(document_id);
    points.insert(points.end(), embedding.begin(), embedding.end());
  }

  Run best;
  bool have_best = false;
  for (int restart = 0; restart < options_.restarts; ++restart) {
    std::mt19937_64 rng(options_.seed + static_cast<uint64_t>(restart));
    Run run = run_once(points, n, dim, k, rng);
    if (!have_best || run.inertia < best.inertia) {
      best = std::move(run);
      have_best = true;
    }
  }

  ClusteringResult result;
  for (size_t i = 0; i < n; ++i) {
    result.assignment[ids[i]] = best.assignment[i];
  }
  result.centroids.resize(k, std::vector<float>(dim));
  for (size_t c = 0; c < k; ++c) {
    for (size_t d = 0; d < dim; ++d) {
      result.centroids[c][d] = static_cast<float>(best.centroids[c * dim + d]);
    }
  }
  result.inertia = best.inertia;
  result.iterations = best.iterations;
  return result;
}

ClusterEngine::Run ClusterEngine::run_once(const std::vector<float> &points, size_t n, size_t dim,
                                           size_t k, std::mt19937_64 &rng) const {
  Run run;
  run.centroids.assign(k * dim, 0.0);
  run.assignment.assign(n, -1);

  // k-means++ seeding
  std::vector<bool> chosen(n, false);
  std::uniform_int_distribution<size_t> pick_first(0, n - 1);
  size_t first = pick_first(rng);
  set_centroid(run.centroids, 0, points.data() + first * dim, dim);
  chosen[first] = true;

  std::vector<double> min_dist(n, std::numeric_limits<double>::max());
  for (size_t c = 1; c < k; ++c) {
    double total = 0.0;
    for (size_t i = 0; i < n; ++i) {
      double dist = distance_sq(points.data() + i * dim, run.centroids.data() + (c - 1) * dim, dim);
      if (dist < min_dist[i]) {
        min_dist[i] = dist;
      }
      if (!chosen[i]) {
        total += min_dist[i];
      }
    }

    size_t next = n;
    if (total > 0.0) {
      std::uniform_real_distribution<double> draw(0.0, total);
      double target = draw(rng);
      double cumulative = 0.0;
      for (size_t i = 0; i < n; ++i) {
        if (chosen[i]) {
          continue;
        }
        cumulative += min_dist[i];
        next = i;
        if (cumulative >= target && min_dist[i] > 0.0) {
          break;
        }
      }
    } else {
      // Every remaining point coincides with a centroid
      for (size_t i = 0; i < n && next == n; ++i) {
        if (!chosen[i]) {
          next = i;
        }
      }
    }
    set_centroid(run.centroids, c, points.data() + next * dim, dim);
    chosen[next] = true;
  }

  // Lloyd iterations
  std::vector<size_t> counts(k, 0);
  for (int iteration = 1; iteration <= options_.max_iterations; ++iteration) {
    const std::vector<int> previous = run.assignment;
    std::fill(counts.begin(), counts.end(), 0);
    for (size_t i = 0; i < n; ++i) {
      int cluster = nearest_centroid(points.data() + i * dim, run.centroids, k, dim).first;
      run.assignment[i] = cluster;
      ++counts[cluster];
    }

    // An empty cluster takes the point farthest from its centroid, drawn from
    // clusters that can spare one
    for (size_t c = 0; c < k; ++c) {
      if (counts[c] > 0) {
        continue;
      }
      size_t farthest = n;
      double farthest_dist = -1.0;
      for (size_t i = 0; i < n; ++i) {
        int owner = run.assignment[i];
        if (counts[owner] < 2) {
          continue;
        }
        double dist = distance_sq(points.data() + i * dim, run.centroids.data() + owner * dim, dim);
        if (dist > farthest_dist) {
          farthest_dist = dist;
          farthest = i;
        }
      }
      --counts[run.assignment[farthest]];
      run.assignment[farthest] = static_cast<int>(c);
      ++counts[c];
    }

    std::fill(run.centroids.begin(), run.centroids.end(), 0.0);
    for (size_t i = 0; i < n; ++i) {
      double *centroid = run.centroids.data() + run.assignment[i] * dim;
      const float *point = points.data() + i * dim;
      for (size_t d = 0; d < dim; ++d) {
        centroid[d] += point[d];
      }
    }
    for (size_t c = 0; c < k; ++c) {
      for (size_t d = 0; d < dim; ++d) {
        run.centroids[c * dim + d] /= static_cast<double>(counts[c]);
      }
    }

    run.iterations = iteration;
    if (run.assignment == previous) {
      break;
    }
  }

  run.inertia = 0.0;
  for (size_t i = 0; i < n; ++i) {
    run.inertia += distance_sq(points.data() + i * dim,
                               run.centroids.data() + run.assignment[i] * dim, dim);
  }
  return run;
}

std::map<int, std::vector<std::string>> ClusterEngine::members_by_cluster(
    const ClusteringResult &result, const std::map<DocumentId, std::string> &display_keys) {
  std::map<int, std::vector<std::string>> members;
  for (size_t c = 0; c < result.centroids.size(); ++c) {
    members[static_cast<int>(c)];
  }
  for (const auto &[document_id, cluster_id] : result.assignment) {
    auto it = display_keys.find(document_id);
    members[cluster_id].push_back(it != display_keys.end() ? it->second
                                                           : std::to_string(document_id));
  }
  return members;
}

}  // namespace lens_core
