#pragma once

#include <map>
#include <string>
#include <vector>

#include "lens_core/store/vector_store.hpp"
#include "lens_core/types/document.hpp"

namespace lens_core {

class AggregationError : public std::exception {
 public:
  explicit AggregationError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

using DocumentEmbeddings = std::map<DocumentId, std::vector<float>>;

// Mean-pools chunk embeddings into one vector per document.
class DocumentAggregator {
 public:
  explicit DocumentAggregator(VectorStorePtr vector_store);

  // Componentwise mean of the document's chunk embeddings.
  // Throws AggregationError when the document owns no chunks.
  std::vector<float> aggregate(DocumentId document_id) const;

  // One streaming pass over every stored chunk; zero-chunk documents are absent.
  DocumentEmbeddings aggregate_all() const;

 private:
  VectorStorePtr vector_store_;
};

}  // namespace lens_core
