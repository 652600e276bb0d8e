#pragma once

#include <memory>
#include <string>
#include <vector>

#include "lens_core/errors.hpp"

namespace lens_core {

// Maps text to fixed-dimension vectors. The i-th output belongs to the i-th input.
class EmbeddingGateway {
 public:
  virtual ~EmbeddingGateway() = default;

  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) = 0;

  virtual std::vector<float> embed_one(const std::string &text) {
    auto vectors = embed({text});
    if (vectors.size() != 1) {
      throw CollaboratorError("Embedding gateway returned " + std::to_string(vectors.size()) +
                                  " vectors for a single text",
                              FailureKind::InvalidInput);
    }
    return std::move(vectors.front());
  }

  virtual size_t dimensions() const = 0;
};

using EmbeddingGatewayPtr = std::shared_ptr<EmbeddingGateway>;

}  // namespace lens_core
