#pragma once

#include <optional>
#include <string>

#include "lens_core/types/document.hpp"

namespace lens_core {

// One chunk hit of a similarity query, with a back-reference to its document.
struct ScoredChunk {
  DocumentId document_id = 0;
  int chunk_index = 0;
  std::string content;
  std::optional<std::string> heading;
  std::string document_title;
  std::string document_slug;
  float similarity = 0.0f;
};

}  // namespace lens_core
