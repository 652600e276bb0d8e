#include "lens_core/analysis/document_aggregator.hpp"

namespace lens_core {

namespace {

// Running componentwise sum. Doubles keep the mean exact to float precision.
struct MeanAccumulator {
  std::vector<double> sum;
  size_t count = 0;

  void add(DocumentId document_id, const std::vector<float> &vector) {
    if (count == 0) {
      sum.assign(vector.size(), 0.0);
    } else if (vector.size() != sum.size()) {
      throw AggregationError("Document " + std::to_string(document_id) +
                             " has chunk embeddings of different dimensions (" +
                             std::to_string(sum.size()) + " and " +
                             std::to_string(vector.size()) + ")");
    }
    for (size_t i = 0; i < vector.size(); ++i) {
      sum[i] += vector[i];
    }
    ++count;
  }

  std::vector<float> mean() const {
    std::vector<float> result(sum.size());
    for (size_t i = 0; i < sum.size(); ++i) {
      result[i] = static_cast<float>(sum[i] / static_cast<double>(count));
    }
    return result;
  }
};

}  // namespace

DocumentAggregator::DocumentAggregator(VectorStorePtr vector_store)
    : vector_store_(std::move(vector_store)) {
  if (!vector_store_) {
    throw ConfigurationError("DocumentAggregator requires a vector store");
  }
}

std::vector<float> DocumentAggregator::aggregate(DocumentId document_id) const {
  MeanAccumulator accumulator;
  for (const auto &embedding : vector_store_->chunk_embeddings(document_id)) {
    accumulator.add(document_id, embedding);
  }
  if (accumulator.count == 0) {
    throw AggregationError("Document " + std::to_string(document_id) + " has no chunks");
  }
  return accumulator.mean();
}

DocumentEmbeddings DocumentAggregator::aggregate_all() const {
  std::map<DocumentId, MeanAccumulator> accumulators;
  vector_store_->for_each_chunk_embedding(
      [&](DocumentId document_id, int /*chunk_index*/, const std::vector<float> &embedding) {
        accumulators[document_id].add(document_id, embedding);
      });

  DocumentEmbeddings embeddings;
  for (const auto &[document_id, accumulator] : accumulators) {
    embeddings.emplace(document_id, accumulator.mean());
  }
  return embeddings;
}

}  // namespace lens_core
