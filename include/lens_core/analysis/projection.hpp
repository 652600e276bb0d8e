#pragma once

#include <cstdint>
#include <map>

#include "lens_core/analysis/document_aggregator.hpp"

namespace lens_core {

struct Point2D {
  double x = 0.0;
  double y = 0.0;
};

// Projects document embeddings onto their first two principal components for
// plotting. Uses power iteration from a start vector drawn with `seed`, so the
// same input and seed give the same points. One point per input document.
std::map<DocumentId, Point2D> project_2d(const DocumentEmbeddings &embeddings, uint64_t seed = 42);

}  // namespace lens_core
