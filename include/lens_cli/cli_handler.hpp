#pragma once

#include <memory>
#include <optional>
#include <string>

#include "lens_core/cancellation.hpp"
#include "lens_core/config.hpp"
#include "lens_core/db/database_manager.hpp"
#include "lens_core/llm/embedding_gateway.hpp"
#include "lens_core/store/vector_store.hpp"

namespace lens_cli {

enum class Command { Ingest, Search, Links, Cluster, List, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string directory;
  std::string query;
  lens_core::DocumentId document_id = 0;
  std::optional<int> top_k;
  std::optional<int> max_links;
  std::optional<int> cluster_count;
  std::optional<float> threshold;
  bool with_labels = false;
  bool with_projection = false;
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(lens_core::Config config, const lens_core::CancellationToken *cancel = nullptr);
  ~CliHandler();

  // Disable copy constructor and assignment
  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Parse command line arguments
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Execute command
  void execute_command(const CliOptions &options);

  static void print_help();

 private:
  // Command handlers
  void handle_ingest_command(const CliOptions &options);
  void handle_search_command(const CliOptions &options);
  void handle_links_command(const CliOptions &options);
  void handle_cluster_command(const CliOptions &options);
  void handle_list_command(const CliOptions &options);

  // Collaborators are opened on first use
  lens_core::VectorStorePtr vector_store();
  lens_core::EmbeddingGatewayPtr embedding_gateway();

  lens_core::Config config_;
  const lens_core::CancellationToken *cancel_;
  std::unique_ptr<lens_core::DatabaseManager> db_manager_;
  lens_core::VectorStorePtr vector_store_;
  lens_core::EmbeddingGatewayPtr embedding_gateway_;
};

}  // namespace lens_cli
