#include "lens_core/services/ingestion_service.hpp"

#include <algorithm>
#include <iostream>

#include "lens_core/ingestion/content_hash.hpp"

namespace lens_core {

IngestionService::IngestionService(VectorStorePtr vector_store,
                                   EmbeddingGatewayPtr embedding_gateway,
                                   std::shared_ptr<const MarkdownChunker> chunker,
                                   RetryPolicy retry_policy,
                                   IngestionOptions options)
    : vector_store_(std::move(vector_store)),
      embedding_gateway_(std::move(embedding_gateway)),
      chunker_(std::move(chunker)),
      retry_policy_(std::move(retry_policy)),
      options_(options) {
  if (!vector_store_ || !embedding_gateway_ || !chunker_) {
    throw ConfigurationError(
        "IngestionService requires a vector store, an embedding gateway and a chunker");
  }
  if (options_.embedding_batch_size == 0) {
    throw ConfigurationError("embedding_batch_size must be greater than 0");
  }
}

IngestionReport IngestionService::ingest(const std::vector<Document> &documents,
                                         const CancellationToken *cancel) {
  IngestionReport report;
  std::cout << "[Ingestion] Ingesting " << documents.size() << " documents" << std::endl;

  for (const auto &document : documents) {
    if (cancel && cancel->is_cancelled()) {
      report.cancelled = true;
      break;
    }

    try {
      switch (ingest_one(document, report, cancel)) {
        case Outcome::Processed:
          ++report.processed;
          break;
        case Outcome::Skipped:
          ++report.skipped;
          break;
        case Outcome::Unchanged:
          ++report.unchanged;
          break;
        case Outcome::Cancelled:
          report.cancelled = true;
          break;
      }
    } catch (const RetryCancelledError &e) {
      std::cout << "[Ingestion] " << e.what() << std::endl;
      report.cancelled = true;
    } catch (const CollaboratorError &e) {
      if (e.kind() == FailureKind::Fatal) {
        std::cerr << "[Ingestion] Fatal failure on '" << document.external_id
                  << "', aborting run: " << e.what() << std::endl;
        throw;
      }
      std::cerr << "[Ingestion] Failed '" << document.external_id << "' (" << to_string(e.kind())
                << "): " << e.what() << std::endl;
      ++report.failed;
      report.failures.push_back({document.external_id, e.what()});
    }

    if (report.cancelled) {
      break;
    }
  }

  std::cout << "[Ingestion] Done: " << report.processed << " processed, " << report.unchanged
            << " unchanged, " << report.skipped << " skipped, " << report.failed << " failed, "
            << report.chunks_written << " chunks written"
            << (report.cancelled ? " (cancelled)" : "") << std::endl;
  return report;
}

IngestionService::Outcome IngestionService::ingest_one(const Document &document,
                                                       IngestionReport &report,
                                                       const CancellationToken *cancel) {
  if (document.external_id.empty()) {
    std::cerr << "[Ingestion] Skipping document without an external id" << std::endl;
    return Outcome::Skipped;
  }
  if (document.content.size() < options_.min_document_bytes) {
    std::cout << "[Ingestion] Skipping '" << document.external_id << "': "
              << document.content.size() << " bytes is below the minimum of "
              << options_.min_document_bytes << std::endl;
    return Outcome::Skipped;
  }

  std::string content_hash = compute_content_hash(document.content);
  auto existing = retry_policy_.run(
      "find_document", [&]() { return vector_store_->find_document(document.external_id); },
      cancel);
  if (existing && existing->content_hash == content_hash && existing->chunk_count > 0) {
    return Outcome::Unchanged;
  }

  std::vector<Chunk> chunks = chunker_->chunk(document.content);
  if (chunks.empty()) {
    std::cout << "[Ingestion] Skipping '" << document.external_id
              << "': no content left after chunking" << std::endl;
    return Outcome::Skipped;
  }

  for (size_t start = 0; start < chunks.size(); start += options_.embedding_batch_size) {
    if (cancel && cancel->is_cancelled()) {
      return Outcome::Cancelled;
    }
    size_t stop = std::min(chunks.size(), start + options_.embedding_batch_size);
    std::vector<std::string> texts;
    texts.reserve(stop - start);
    for (size_t i = start; i < stop; ++i) {
      texts.push_back(chunks[i].content);
    }

    std::vector<std::vector<float>> vectors = embedding_gateway_->embed(texts);
    if (vectors.size() != texts.size()) {
      throw CollaboratorError("Embedding gateway returned " + std::to_string(vectors.size()) +
                                  " vectors for " + std::to_string(texts.size()) + " texts",
                              FailureKind::InvalidInput);
    }
    for (size_t i = start; i < stop; ++i) {
      chunks[i].vector_embedding = std::move(vectors[i - start]);
    }
  }

  // The stored hash changes only once the new chunks are written
  Document record = document;
  record.content_hash = existing ? existing->content_hash : "";
  record.chunks.clear();

  DocumentId document_id = retry_policy_.run(
      "upsert_document", [&]() { return vector_store_->upsert_document(record); }, cancel);
  retry_policy_.run(
      "upsert_chunks", [&]() { vector_store_->upsert_chunks(document_id, chunks); }, cancel);
  retry_policy_.run(
      "prune_chunks", [&]() { vector_store_->prune_chunks(document_id, chunks.size()); }, cancel);

  record.content_hash = content_hash;
  retry_policy_.run(
      "upsert_document", [&]() { return vector_store_->upsert_document(record); }, cancel);

  report.chunks_written += chunks.size();
  std::cout << "[Ingestion] Stored '" << document.external_id << "' as document " << document_id
            << " with " << chunks.size() << " chunks" << std::endl;
  return Outcome::Processed;
}

}  // namespace lens_core
