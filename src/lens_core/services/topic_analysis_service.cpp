#include "lens_core/services/topic_analysis_service.hpp"

#include <iostream>

#include "lens_core/retry_policy.hpp"

namespace lens_core {

TopicAnalysisService::TopicAnalysisService(VectorStorePtr vector_store,
                                           ClusterEngine cluster_engine,
                                           LabelServicePtr label_service)
    : vector_store_(vector_store),
      aggregator_(vector_store),
      cluster_engine_(std::move(cluster_engine)),
      label_service_(std::move(label_service)) {}

TopicReport TopicAnalysisService::analyze(size_t k, bool with_labels, bool with_projection) {
  DocumentEmbeddings embeddings = aggregator_.aggregate_all();
  if (k == 0 || k > embeddings.size()) {
    throw ConfigurationError("Cannot form " + std::to_string(k) + " clusters from " +
                             std::to_string(embeddings.size()) + " documents with chunks");
  }

  TopicReport report;
  report.clustering = cluster_engine_.cluster(embeddings, k);
  std::cout << "[Topics] Clustered " << embeddings.size() << " documents into " << k
            << " clusters (inertia " << report.clustering.inertia << ", "
            << report.clustering.iterations << " iterations)" << std::endl;

  std::map<DocumentId, std::string> titles;
  for (const auto &summary : vector_store_->list_documents()) {
    titles[summary.id] = summary.title;
  }
  auto members = ClusterEngine::members_by_cluster(report.clustering, titles);

  std::vector<int> cluster_ids;
  for (const auto &[cluster_id, member_titles] : members) {
    cluster_ids.push_back(cluster_id);
  }
  ClusterLabels labels;
  if (with_labels) {
    labels = label_clusters(members, report.labels_degraded);
  }
  labels = complete_labels(cluster_ids, labels);

  for (const auto &[cluster_id, member_titles] : members) {
    TopicCluster cluster;
    cluster.cluster_id = cluster_id;
    cluster.label = labels[cluster_id].label;
    cluster.gaps = labels[cluster_id].gaps;
    cluster.titles = member_titles;
    report.clusters.push_back(std::move(cluster));
  }
  for (const auto &[document_id, cluster_id] : report.clustering.assignment) {
    report.clusters[cluster_id].document_ids.push_back(document_id);
  }

  if (with_projection) {
    report.projection = project_2d(embeddings, cluster_engine_.options().seed);
  }
  return report;
}

ClusterLabels TopicAnalysisService::label_clusters(
    const std::map<int, std::vector<std::string>> &members, bool &degraded) {
  if (!label_service_) {
    std::cerr << "[Topics] No label service configured; using placeholder labels" << std::endl;
    degraded = true;
    return {};
  }
  try {
    return label_service_->label(members);
  } catch (const CollaboratorError &e) {
    std::cerr << "[Topics] Labeling failed, using placeholder labels: " << e.what() << std::endl;
  } catch (const RetryCancelledError &e) {
    std::cerr << "[Topics] Labeling cancelled, using placeholder labels: " << e.what()
              << std::endl;
  }
  degraded = true;
  return {};
}

}  // namespace lens_core
