#include "lens_core/llm/ollama_client.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "ollama.hpp"

namespace lens_core {

OllamaClient::OllamaClient(OllamaClientOptions options, RetryPolicy retry_policy)
    : options_(std::move(options)), retry_policy_(std::move(retry_policy)) {
  if (options_.dimensions == 0 || options_.batch_size == 0) {
    throw ConfigurationError("OllamaClient needs positive dimensions and batch size");
  }
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  // Set the server URL for ollama-hpp
  ollama::setServerURL(options_.ollama_url);
  if (!ollama::is_running()) {
    throw OllamaError("Ollama server is not running at " + options_.ollama_url,
                      FailureKind::Transient);
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

FailureKind OllamaClient::classify_failure(const std::string &message) {
  std::string lowered = message;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  auto mentions = [&](const char *needle) { return lowered.find(needle) != std::string::npos; };

  if (mentions("401") || mentions("403") || mentions("unauthorized") ||
      mentions("forbidden") || mentions("not found") || mentions("404")) {
    return FailureKind::Fatal;
  }
  if (mentions("400") || mentions("bad request") || mentions("invalid input")) {
    return FailureKind::InvalidInput;
  }
  if (mentions("timeout") || mentions("timed out") || mentions("connection") ||
      mentions("no response") || mentions("429") || mentions("500") || mentions("502") ||
      mentions("503") || mentions("504")) {
    return FailureKind::Transient;
  }
  return FailureKind::Fatal;
}

std::vector<std::vector<float>> OllamaClient::parse_embeddings_response(
    const nlohmann::json &response, size_t expected_count, size_t dimensions) {
  if (!response.is_object() || !response.contains("embeddings")) {
    throw OllamaError("Response does not contain embeddings field", FailureKind::InvalidInput);
  }
  const auto &embeddings = response["embeddings"];
  if (!embeddings.is_array()) {
    throw OllamaError("Embeddings field is not an array", FailureKind::InvalidInput);
  }
  if (embeddings.size() != expected_count) {
    throw OllamaError("Expected " + std::to_string(expected_count) + " embeddings, got " +
                          std::to_string(embeddings.size()),
                      FailureKind::InvalidInput);
  }

  std::vector<std::vector<float>> vectors;
  vectors.reserve(expected_count);
  for (const auto &embedding : embeddings) {
    if (!embedding.is_array() || embedding.size() != dimensions) {
      throw OllamaError("Embedding has " + std::to_string(embedding.size()) +
                            " dimensions, expected " + std::to_string(dimensions),
                        FailureKind::InvalidInput);
    }
    try {
      vectors.push_back(embedding.get<std::vector<float>>());
    } catch (const nlohmann::json::exception &e) {
      throw OllamaError(std::string("Embedding contains non-numeric values: ") + e.what(),
                        FailureKind::InvalidInput);
    }
  }
  return vectors;
}

std::vector<std::vector<float>> OllamaClient::embed_batch(const std::vector<std::string> &batch) {
  try {
    ollama::request request(ollama::message_type::embedding);
    request["model"] = options_.embedding_model;
    request["input"] = batch;

    ollama::response response = ollama::generate_embeddings(request);
    return parse_embeddings_response(response.as_json(), batch.size(), options_.dimensions);
  } catch (const ollama::exception &e) {
    // Wrap ollama-hpp exceptions so the retry policy can classify them
    throw OllamaError("Embedding generation failed: " + std::string(e.what()),
                      classify_failure(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::embed(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());

  for (size_t start = 0; start < texts.size(); start += options_.batch_size) {
    size_t stop = std::min(texts.size(), start + options_.batch_size);
    std::vector<std::string> batch(texts.begin() + start, texts.begin() + stop);

    auto batch_vectors =
        retry_policy_.run("embed batch", [&]() { return embed_batch(batch); });
    for (auto &vector : batch_vectors) {
      vectors.push_back(std::move(vector));
    }
  }
  return vectors;
}

}  // namespace lens_core
