#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "lens_core/analysis/cluster_engine.hpp"
#include "lens_core/analysis/document_aggregator.hpp"
#include "lens_core/analysis/projection.hpp"
#include "lens_core/llm/label_service.hpp"
#include "lens_core/store/vector_store.hpp"

namespace lens_core {

struct TopicCluster {
  int cluster_id = 0;
  std::string label;
  std::vector<std::string> gaps;
  std::vector<DocumentId> document_ids;
  std::vector<std::string> titles;
};

struct TopicReport {
  ClusteringResult clustering;
  std::vector<TopicCluster> clusters;        // ordered by cluster id
  std::map<DocumentId, Point2D> projection;  // empty unless requested
  bool labels_degraded = false;              // the label service failed, placeholders used
};

/**
 * @brief Clusters the stored corpus into topics.
 *
 * The requested cluster count is checked against the number of documents with
 * chunks before any clustering or labeling happens. Label service failures
 * fall back to "Topic <id>" placeholders instead of failing the run.
 */
class TopicAnalysisService {
 public:
  TopicAnalysisService(VectorStorePtr vector_store,
                       ClusterEngine cluster_engine,
                       LabelServicePtr label_service = nullptr);

  TopicReport analyze(size_t k, bool with_labels, bool with_projection);

 private:
  ClusterLabels label_clusters(const std::map<int, std::vector<std::string>> &members,
                               bool &degraded);

  VectorStorePtr vector_store_;
  DocumentAggregator aggregator_;
  ClusterEngine cluster_engine_;
  LabelServicePtr label_service_;
};

}  // namespace lens_core
