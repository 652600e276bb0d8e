#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "lens_core/types/chunk.hpp"

namespace lens_core {

using DocumentId = int64_t;

// A document as handed to ingestion. `external_id` is the stable natural key
// (post id, relative path, ...) used for upserts.
struct Document {
  DocumentId id = 0;
  std::string external_id;
  std::string title;
  std::string url_slug;
  std::string content;
  std::string content_hash;
  std::vector<Chunk> chunks;
};

// Listing view without text or chunks.
struct DocumentSummary {
  DocumentId id = 0;
  std::string external_id;
  std::string title;
  std::string url_slug;
  std::string content_hash;
  size_t chunk_count = 0;
};

}  // namespace lens_core
