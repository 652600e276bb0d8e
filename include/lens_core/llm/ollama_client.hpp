#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "lens_core/errors.hpp"
#include "lens_core/llm/embedding_gateway.hpp"
#include "lens_core/retry_policy.hpp"

namespace lens_core {

class OllamaError : public CollaboratorError {
 public:
  explicit OllamaError(const std::string &message, FailureKind kind = FailureKind::Fatal)
      : CollaboratorError(message, kind) {}
};

struct OllamaClientOptions {
  std::string ollama_url = "http://localhost:11434";
  std::string embedding_model = "nomic-embed-text";
  size_t dimensions = 1536;
  size_t batch_size = 100;
};

class OllamaClient : public EmbeddingGateway {
 public:
  OllamaClient(OllamaClientOptions options, RetryPolicy retry_policy);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // One /api/embed request per batch of at most batch_size inputs
  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;

  size_t dimensions() const override {
    return options_.dimensions;
  }

  virtual bool is_server_available();

  // Validates an /api/embed response body and extracts its vectors
  static std::vector<std::vector<float>> parse_embeddings_response(const nlohmann::json &response,
                                                                   size_t expected_count,
                                                                   size_t dimensions);

  // Maps an ollama-hpp failure message onto a FailureKind
  static FailureKind classify_failure(const std::string &message);

 private:
  std::vector<std::vector<float>> embed_batch(const std::vector<std::string> &batch);
  void setup_server_connection();

  OllamaClientOptions options_;
  RetryPolicy retry_policy_;
};

}  // namespace lens_core
