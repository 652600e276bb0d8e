#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace lens_core {

class Config {
 public:
  // Chunking
  int max_chunk_tokens;
  int merge_threshold_tokens;
  int min_document_bytes;

  // Embedding gateway
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimensions;
  int embedding_batch_size;

  // Label/gap service
  std::string label_model;

  // Vector store
  std::string database_path;
  std::string database_key;
  int pool_size;
  int store_write_batch_size;

  // Retry policy for collaborator calls
  int retry_max_attempts;
  int retry_initial_backoff_ms;

  // Analysis
  int default_cluster_count;
  int default_similar_chunks;
  int default_link_suggestions;
  float similarity_threshold;
  unsigned int cluster_seed;
  int cluster_restarts;
  int cluster_max_iterations;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      config.max_chunk_tokens = json_config.value("max_chunk_tokens", 1000);
      config.merge_threshold_tokens = json_config.value("merge_threshold_tokens", 750);
      config.min_document_bytes = json_config.value("min_document_bytes", 100);

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model =
          json_config.value("embedding_model", std::string("nomic-embed-text"));
      config.embedding_dimensions = json_config.value("embedding_dimensions", 1536);
      config.embedding_batch_size = json_config.value("embedding_batch_size", 100);

      config.label_model = json_config.value("label_model", std::string("llama3.1"));

      config.database_path = json_config.value("database_path", std::string("./data/lens.db"));
      config.database_key = json_config.value("database_key", std::string(""));
      config.pool_size = json_config.value("pool_size", 2);
      config.store_write_batch_size = json_config.value("store_write_batch_size", 5);

      config.retry_max_attempts = json_config.value("retry_max_attempts", 3);
      config.retry_initial_backoff_ms = json_config.value("retry_initial_backoff_ms", 500);

      config.default_cluster_count = json_config.value("default_cluster_count", 15);
      config.default_similar_chunks = json_config.value("default_similar_chunks", 15);
      config.default_link_suggestions = json_config.value("default_link_suggestions", 8);
      config.similarity_threshold = json_config.value("similarity_threshold", 0.5f);
      config.cluster_seed = json_config.value("cluster_seed", 42u);
      config.cluster_restarts = json_config.value("cluster_restarts", 10);
      config.cluster_max_iterations = json_config.value("cluster_max_iterations", 300);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid value type in config: ") + e.what());
    }

    // The key never has to live in the config file
    if (const char* env_key = std::getenv("LENS_DB_KEY"); env_key && *env_key) {
      config.database_key = env_key;
    }

    config.validate();
    return config;
  }

 private:
  void validate() const {
    if (max_chunk_tokens <= 0) {
      throw std::runtime_error("max_chunk_tokens must be greater than 0");
    }
    if (merge_threshold_tokens <= 0) {
      throw std::runtime_error("merge_threshold_tokens must be greater than 0");
    }
    if (min_document_bytes < 0) {
      throw std::runtime_error("min_document_bytes cannot be negative");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (embedding_dimensions <= 0) {
      throw std::runtime_error("embedding_dimensions must be greater than 0");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (database_path.empty()) {
      throw std::runtime_error("database_path cannot be empty");
    }
    if (pool_size <= 0) {
      throw std::runtime_error("pool_size must be greater than 0");
    }
    if (store_write_batch_size <= 0) {
      throw std::runtime_error("store_write_batch_size must be greater than 0");
    }
    if (retry_max_attempts < 1) {
      throw std::runtime_error("retry_max_attempts must be at least 1");
    }
    if (retry_initial_backoff_ms < 0) {
      throw std::runtime_error("retry_initial_backoff_ms cannot be negative");
    }
    if (default_cluster_count <= 0) {
      throw std::runtime_error("default_cluster_count must be greater than 0");
    }
    if (default_similar_chunks <= 0) {
      throw std::runtime_error("default_similar_chunks must be greater than 0");
    }
    if (default_link_suggestions <= 0) {
      throw std::runtime_error("default_link_suggestions must be greater than 0");
    }
    if (similarity_threshold < -1.0f || similarity_threshold > 1.0f) {
      throw std::runtime_error("similarity_threshold must be within [-1, 1]");
    }
    if (cluster_restarts < 1) {
      throw std::runtime_error("cluster_restarts must be at least 1");
    }
    if (cluster_max_iterations < 1) {
      throw std::runtime_error("cluster_max_iterations must be at least 1");
    }
  }
};

}  // namespace lens_core
