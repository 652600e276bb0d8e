#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lens_core/chunking/tokenizer.hpp"
#include "lens_core/types/chunk.hpp"

namespace lens_core {

struct ChunkerOptions {
  int max_chunk_tokens = 1000;
  int merge_threshold_tokens = 750;
};

/**
 * @brief Heading-aware, token-budgeted chunker for markdown documents.
 *
 * Sections start at level-2 and level-3 headings. Adjacent small sections are
 * merged forward while they fit under the merge threshold, oversized sections
 * are packed paragraph by paragraph under the chunk budget. A paragraph that
 * alone exceeds the budget is emitted whole.
 *
 * Pure and deterministic: the same text and options always yield the same
 * (index, content, heading) triples.
 */
class MarkdownChunker {
 public:
  MarkdownChunker(TokenizerPtr tokenizer, ChunkerOptions options);

  std::vector<Chunk> chunk(const std::string& text) const;

  const ChunkerOptions& options() const {
    return options_;
  }

 protected:
  struct Section {
    std::optional<std::string> heading;
    std::string text;
  };

  std::vector<Section> split_by_headings(const std::string& text) const;
  std::vector<Section> merge_small_sections(const std::vector<Section>& sections) const;
  std::vector<std::string> split_by_paragraphs(const std::string& text) const;

  static constexpr const char* SECTION_SEPARATOR = "\n\n";

 private:
  TokenizerPtr tokenizer_;
  ChunkerOptions options_;
};

// Trims ASCII whitespace from both ends.
std::string strip(const std::string& text);

}  // namespace lens_core
