#pragma once

#include <optional>
#include <string>
#include <vector>

namespace lens_core {

struct Chunk {
  int chunk_index = 0;
  std::string content;
  std::optional<std::string> heading;
  size_t token_count = 0;
  std::vector<float> vector_embedding;
};

}  // namespace lens_core
