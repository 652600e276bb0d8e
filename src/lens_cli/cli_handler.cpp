#include "lens_cli/cli_handler.hpp"

#include <iomanip>
#include <iostream>

#include "lens_core/analysis/cluster_engine.hpp"
#include "lens_core/chunking/markdown_chunker.hpp"
#include "lens_core/ingestion/markdown_loader.hpp"
#include "lens_core/llm/label_service.hpp"
#include "lens_core/llm/ollama_client.hpp"
#include "lens_core/retry_policy.hpp"
#include "lens_core/services/ingestion_service.hpp"
#include "lens_core/services/retrieval_service.hpp"
#include "lens_core/services/topic_analysis_service.hpp"
#include "lens_core/store/sqlite_vector_store.hpp"

namespace lens_cli {

namespace {

int parse_int(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    int parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid value for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid value for " + flag + ": " + value);
  }
}

float parse_float(const std::string &flag, const std::string &value) {
  try {
    size_t consumed = 0;
    float parsed = std::stof(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid value for " + flag + ": " + value);
    }
    return parsed;
  } catch (const std::logic_error &) {
    throw CliError("Invalid value for " + flag + ": " + value);
  }
}

lens_core::RetryPolicy make_retry_policy(const lens_core::Config &config) {
  return lens_core::RetryPolicy(config.retry_max_attempts,
                                std::chrono::milliseconds(config.retry_initial_backoff_ms));
}

}  // namespace

CliHandler::CliHandler(lens_core::Config config, const lens_core::CancellationToken *cancel)
    : config_(std::move(config)), cancel_(cancel) {}

CliHandler::~CliHandler() = default;

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;
  if (argc < 2) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[1];
  if (command == "ingest" || command == "i") {
    options.command = Command::Ingest;
  } else if (command == "search" || command == "s") {
    options.command = Command::Search;
  } else if (command == "links" || command == "ln") {
    options.command = Command::Links;
  } else if (command == "cluster" || command == "c") {
    options.command = Command::Cluster;
  } else if (command == "list" || command == "l") {
    options.command = Command::List;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
    return options;
  } else {
    throw CliError("Unknown command: " + command);
  }

  bool have_id = false;
  for (int i = 2; i < argc; ++i) {
    std::string flag = argv[i];

    // Switches
    if (flag == "--labels") {
      options.with_labels = true;
      continue;
    }
    if (flag == "--projection") {
      options.with_projection = true;
      continue;
    }

    if (i + 1 >= argc) {
      throw CliError("Missing value for " + flag);
    }
    std::string value = argv[++i];

    if (flag == "--dir" || flag == "-d") {
      options.directory = value;
    } else if (flag == "--query" || flag == "-q") {
      options.query = value;
    } else if (flag == "--id" || flag == "-i") {
      options.document_id = parse_int(flag, value);
      have_id = true;
    } else if (flag == "--top-k" || flag == "-k") {
      options.top_k = parse_int(flag, value);
    } else if (flag == "--max" || flag == "-m") {
      options.max_links = parse_int(flag, value);
    } else if (flag == "--clusters" || flag == "-n") {
      options.cluster_count = parse_int(flag, value);
    } else if (flag == "--threshold" || flag == "-t") {
      options.threshold = parse_float(flag, value);
    } else {
      throw CliError("Unknown flag: " + flag);
    }
  }

  if (options.command == Command::Ingest && options.directory.empty()) {
    throw CliError("Ingest command requires a directory. Usage: ingest --dir <path>");
  }
  if (options.command == Command::Search && options.query.empty()) {
    throw CliError("Search command requires a query. Usage: search --query <query>");
  }
  if (options.command == Command::Links && !have_id) {
    throw CliError("Links command requires a document id. Usage: links --id <document_id>");
  }
  for (const auto &count : {options.top_k, options.max_links, options.cluster_count}) {
    if (count && *count <= 0) {
      throw CliError("Counts must be greater than 0");
    }
  }
  return options;
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Ingest:
      handle_ingest_command(options);
      break;
    case Command::Search:
      handle_search_command(options);
      break;
    case Command::Links:
      handle_links_command(options);
      break;
    case Command::Cluster:
      handle_cluster_command(options);
      break;
    case Command::List:
      handle_list_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

lens_core::VectorStorePtr CliHandler::vector_store() {
  if (!vector_store_) {
    db_manager_ = std::make_unique<lens_core::DatabaseManager>(
        config_.database_path, config_.database_key, config_.pool_size);
    vector_store_ = std::make_shared<lens_core::SqliteVectorStore>(
        *db_manager_, static_cast<size_t>(config_.embedding_dimensions),
        static_cast<size_t>(config_.store_write_batch_size));
  }
  return vector_store_;
}

lens_core::EmbeddingGatewayPtr CliHandler::embedding_gateway() {
  if (!embedding_gateway_) {
    lens_core::OllamaClientOptions options{
        .ollama_url = config_.ollama_url,
        .embedding_model = config_.embedding_model,
        .dimensions = static_cast<size_t>(config_.embedding_dimensions),
        .batch_size = static_cast<size_t>(config_.embedding_batch_size)};
    embedding_gateway_ =
        std::make_shared<lens_core::OllamaClient>(options, make_retry_policy(config_));
  }
  return embedding_gateway_;
}

void CliHandler::handle_ingest_command(const CliOptions &options) {
  std::vector<lens_core::Document> documents = lens_core::load_markdown_directory(options.directory);
  std::cout << "Found " << documents.size() << " markdown documents in " << options.directory
            << std::endl;

  auto chunker = std::make_shared<const lens_core::MarkdownChunker>(
      std::make_shared<const lens_core::WordPieceTokenizer>(),
      lens_core::ChunkerOptions{.max_chunk_tokens = config_.max_chunk_tokens,
                                .merge_threshold_tokens = config_.merge_threshold_tokens});

  lens_core::IngestionService ingestion(
      vector_store(), embedding_gateway(), chunker, make_retry_policy(config_),
      lens_core::IngestionOptions{
          .min_document_bytes = static_cast<size_t>(config_.min_document_bytes),
          .embedding_batch_size = static_cast<size_t>(config_.embedding_batch_size)});

  lens_core::IngestionReport report = ingestion.ingest(documents, cancel_);
  std::cout << "\nProcessed: " << report.processed << "\nUnchanged: " << report.unchanged
            << "\nSkipped:   " << report.skipped << "\nFailed:    " << report.failed
            << "\nChunks:    " << report.chunks_written << std::endl;
  for (const auto &failure : report.failures) {
    std::cout << "  - " << failure.external_id << ": " << failure.reason << std::endl;
  }
  if (report.cancelled) {
    std::cout << "Ingestion was cancelled; re-run to resume." << std::endl;
  }
}

void CliHandler::handle_search_command(const CliOptions &options) {
  lens_core::RetrievalService retrieval(vector_store(), embedding_gateway());
  auto results = retrieval.retrieve(
      options.query, static_cast<size_t>(options.top_k.value_or(config_.default_similar_chunks)),
      options.threshold.value_or(config_.similarity_threshold));

  if (results.empty()) {
    std::cout << "No results found." << std::endl;
    return;
  }
  std::cout << "Found " << results.size() << " results:\n" << std::endl;
  for (size_t i = 0; i < results.size(); ++i) {
    const auto &hit = results[i];
    std::cout << i + 1 << ". " << hit.document_title << " [" << hit.document_id << ":"
              << hit.chunk_index << "]" << std::endl;
    if (hit.heading) {
      std::cout << "   Section: " << *hit.heading << std::endl;
    }
    std::cout << "   Similarity: " << std::fixed << std::setprecision(3) << hit.similarity
              << std::endl;
    std::cout << "   " << lens_core::truncate_utf8(hit.content, 200) << "\n" << std::endl;
  }
}

void CliHandler::handle_links_command(const CliOptions &options) {
  lens_core::RetrievalService retrieval(vector_store(), embedding_gateway());
  auto suggestions = retrieval.suggest_links(
      options.document_id,
      static_cast<size_t>(options.top_k.value_or(config_.default_similar_chunks)),
      options.threshold.value_or(config_.similarity_threshold),
      static_cast<size_t>(options.max_links.value_or(config_.default_link_suggestions)));

  if (suggestions.empty()) {
    std::cout << "No link suggestions found." << std::endl;
    return;
  }
  for (size_t i = 0; i < suggestions.size(); ++i) {
    const auto &suggestion = suggestions[i];
    std::cout << i + 1 << ". " << suggestion.title << " (/" << suggestion.url_slug << ")"
              << std::endl;
    std::cout << "   Similarity: " << std::fixed << std::setprecision(3)
              << suggestion.best_chunk.similarity << std::endl;
    if (suggestion.best_chunk.heading) {
      std::cout << "   Section: " << *suggestion.best_chunk.heading << std::endl;
    }
  }
}

void CliHandler::handle_cluster_command(const CliOptions &options) {
  lens_core::ClusterEngine engine(lens_core::ClusterOptions{
      .seed = config_.cluster_seed,
      .restarts = config_.cluster_restarts,
      .max_iterations = config_.cluster_max_iterations});

  lens_core::LabelServicePtr label_service;
  if (options.with_labels) {
    label_service = std::make_shared<lens_core::OllamaLabelService>(
        lens_core::OllamaLabelOptions{.ollama_url = config_.ollama_url,
                                      .model = config_.label_model},
        make_retry_policy(config_));
  }

  lens_core::TopicAnalysisService analysis(vector_store(), engine, label_service);
  auto report = analysis.analyze(
      static_cast<size_t>(options.cluster_count.value_or(config_.default_cluster_count)),
      options.with_labels, options.with_projection);

  for (const auto &cluster : report.clusters) {
    std::cout << "Cluster " << cluster.cluster_id << ": " << cluster.label << " ("
              << cluster.titles.size() << " documents)" << std::endl;
    for (const auto &title : cluster.titles) {
      std::cout << "  - " << title << std::endl;
    }
    if (!cluster.gaps.empty()) {
      std::cout << "  Gaps:" << std::endl;
      for (const auto &gap : cluster.gaps) {
        std::cout << "    * " << gap << std::endl;
      }
    }
  }
  if (report.labels_degraded) {
    std::cout << "\nLabels could not be generated; placeholders shown." << std::endl;
  }
  if (options.with_projection) {
    std::cout << "\nProjection (document_id, cluster, x, y):" << std::endl;
    for (const auto &[document_id, point] : report.projection) {
      std::cout << document_id << "," << report.clustering.assignment.at(document_id) << ","
                << point.x << "," << point.y << std::endl;
    }
  }
}

void CliHandler::handle_list_command(const CliOptions & /*options*/) {
  auto documents = vector_store()->list_documents();
  if (documents.empty()) {
    std::cout << "No documents stored." << std::endl;
    return;
  }
  std::cout << std::left << std::setw(6) << "ID" << std::setw(8) << "Chunks"
            << "Title" << std::endl;
  for (const auto &document : documents) {
    std::cout << std::left << std::setw(6) << document.id << std::setw(8) << document.chunk_count
              << document.title << "  (" << document.external_id << ")" << std::endl;
  }
}

void CliHandler::print_help() {
  std::cout << "Topic Lens CLI\n\n"
            << "Usage: lens_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  ingest, i     Chunk, embed and store every markdown file in a directory\n"
            << "                  --dir, -d <path>\n"
            << "  search, s     Find passages similar to a query\n"
            << "                  --query, -q <text> [--top-k, -k <n>] [--threshold, -t <x>]\n"
            << "  links, ln     Suggest other documents to link from a stored document\n"
            << "                  --id, -i <document_id> [--max, -m <n>] [--top-k, -k <n>]\n"
            << "                  [--threshold, -t <x>]\n"
            << "  cluster, c    Group stored documents into topics\n"
            << "                  [--clusters, -n <k>] [--labels] [--projection]\n"
            << "  list, l       List stored documents\n"
            << "  help, h       Show this help\n\n"
            << "Configuration is read from $LENS_CONFIG or ./lensrc.json when present.\n"
            << "The database key may be supplied through $LENS_DB_KEY.\n";
}

}  // namespace lens_cli
