#include "lens_core/llm/ollama_client.hpp"

#include <gtest/gtest.h>

namespace lens_tests {

using lens_core::FailureKind;
using lens_core::OllamaClient;
using lens_core::OllamaError;

// Only the static helpers are exercised here: constructing an OllamaClient
// contacts the server.

TEST(OllamaClientParseTest, ExtractsVectorsInInputOrder) {
  nlohmann::json response = {{"model", "nomic-embed-text"},
                             {"embeddings", {{0.1, 0.2, 0.3}, {1.0, -1.0, 0.5}}}};

  auto vectors = OllamaClient::parse_embeddings_response(response, 2, 3);

  ASSERT_EQ(vectors.size(), 2u);
  EXPECT_FLOAT_EQ(vectors[0][1], 0.2f);
  EXPECT_FLOAT_EQ(vectors[1][0], 1.0f);
  EXPECT_FLOAT_EQ(vectors[1][2], 0.5f);
}

TEST(OllamaClientParseTest, MalformedResponsesAreInvalidInput) {
  auto expect_invalid = [](const nlohmann::json &response, size_t count, size_t dims) {
    try {
      OllamaClient::parse_embeddings_response(response, count, dims);
      ADD_FAILURE() << "expected OllamaError for " << response.dump();
    } catch (const OllamaError &e) {
      EXPECT_EQ(e.kind(), FailureKind::InvalidInput) << response.dump();
    }
  };

  expect_invalid(nlohmann::json::object(), 1, 2);
  expect_invalid({{"embeddings", "nope"}}, 1, 2);
  expect_invalid({{"embeddings", {{0.1, 0.2}}}}, 2, 2);
  expect_invalid({{"embeddings", {{0.1, 0.2, 0.3}}}}, 1, 2);
  expect_invalid({{"embeddings", {{0.1, "x"}}}}, 1, 2);
}

TEST(OllamaClientClassifyTest, MapsMessagesToFailureKinds) {
  EXPECT_EQ(OllamaClient::classify_failure("HTTP 503 Service Unavailable"), FailureKind::Transient);
  EXPECT_EQ(OllamaClient::classify_failure("Connection refused"), FailureKind::Transient);
  EXPECT_EQ(OllamaClient::classify_failure("request timed out"), FailureKind::Transient);
  EXPECT_EQ(OllamaClient::classify_failure("429 too many requests"), FailureKind::Transient);
  EXPECT_EQ(OllamaClient::classify_failure("401 Unauthorized"), FailureKind::Fatal);
  EXPECT_EQ(OllamaClient::classify_failure("model \"x\" not found"), FailureKind::Fatal);
  EXPECT_EQ(OllamaClient::classify_failure("400 Bad Request: input too long"),
            FailureKind::InvalidInput);
  EXPECT_EQ(OllamaClient::classify_failure("something odd"), FailureKind::Fatal);
}

}  // namespace lens_tests
