#include "lens_core/chunking/markdown_chunker.hpp"

#include <cctype>
#include <sstream>

#include "lens_core/errors.hpp"

namespace lens_core {

namespace {

// Matches "##" or "###" followed by whitespace and at least one more character.
// Returns the stripped heading text, which may be empty.
std::optional<std::string> parse_heading_line(const std::string& line) {
  size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') {
    ++hashes;
  }
  if (hashes < 2 || hashes > 3 || line.size() < hashes + 2) {
    return std::nullopt;
  }
  if (!std::isspace(static_cast<unsigned char>(line[hashes]))) {
    return std::nullopt;
  }
  return strip(line.substr(hashes + 1));
}

}  // namespace

std::string strip(const std::string& text) {
  const char* whitespace = " \t\n\r\f\v";
  size_t begin = text.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(whitespace);
  return text.substr(begin, end - begin + 1);
}

MarkdownChunker::MarkdownChunker(TokenizerPtr tokenizer, ChunkerOptions options)
    : tokenizer_(std::move(tokenizer)), options_(options) {
  if (!tokenizer_) {
    throw ConfigurationError("MarkdownChunker requires a tokenizer");
  }
  if (options_.max_chunk_tokens <= 0) {
    throw ConfigurationError("max_chunk_tokens must be greater than 0, got " +
                             std::to_string(options_.max_chunk_tokens));
  }
  if (options_.merge_threshold_tokens <= 0) {
    throw ConfigurationError("merge_threshold_tokens must be greater than 0, got " +
                             std::to_string(options_.merge_threshold_tokens));
  }
}

std::vector<Chunk> MarkdownChunker::chunk(const std::string& text) const {
  if (strip(text).empty()) {
    return {};
  }

  std::vector<Section> sections = split_by_headings(text);
  // No usable section: the whole text is one headingless section
  if (sections.empty()) {
    sections.push_back({std::nullopt, text});
  }

  sections = merge_small_sections(sections);

  std::vector<Section> pieces;
  const size_t max_tokens = static_cast<size_t>(options_.max_chunk_tokens);
  for (auto& section : sections) {
    if (tokenizer_->count_tokens(section.text) > max_tokens) {
      for (auto& sub_text : split_by_paragraphs(section.text)) {
        pieces.push_back({section.heading, std::move(sub_text)});
      }
    } else {
      pieces.push_back(std::move(section));
    }
  }

  std::vector<Chunk> final_chunks;
  int current_chunk_index = 0;
  for (auto& piece : pieces) {
    std::string content = strip(piece.text);
    if (content.empty()) {
      continue;
    }
    size_t token_count = tokenizer_->count_tokens(content);
    final_chunks.push_back({.chunk_index = current_chunk_index++,
                            .content = std::move(content),
                            .heading = piece.heading,
                            .token_count = token_count});
  }
  return final_chunks;
}

std::vector<MarkdownChunker::Section> MarkdownChunker::split_by_headings(
    const std::string& text) const {
  std::vector<Section> sections;
  std::optional<std::string> current_heading;
  std::vector<std::string> current_lines;

  auto flush = [&]() {
    if (current_lines.empty()) {
      return;
    }
    std::ostringstream joined;
    for (size_t i = 0; i < current_lines.size(); ++i) {
      if (i > 0) {
        joined << '\n';
      }
      joined << current_lines[i];
    }
    std::string body = strip(joined.str());
    if (!body.empty()) {
      sections.push_back({current_heading, std::move(body)});
    }
  };

  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (auto heading = parse_heading_line(line)) {
      flush();
      // A blank heading counts as no heading
      current_heading = heading->empty() ? std::nullopt : std::move(heading);
      current_lines.clear();
    } else {
      current_lines.push_back(line);
    }
  }
  flush();

  return sections;
}

std::vector<MarkdownChunker::Section> MarkdownChunker::merge_small_sections(
    const std::vector<Section>& sections) const {
  if (sections.empty()) {
    return {};
  }

  const size_t threshold = static_cast<size_t>(options_.merge_threshold_tokens);
  std::vector<Section> merged{sections.front()};
  size_t running_tokens = tokenizer_->count_tokens(merged.back().text);

  // Greedy: only ever merges into the immediately preceding running section
  for (size_t i = 1; i < sections.size(); ++i) {
    const Section& section = sections[i];
    size_t section_tokens = tokenizer_->count_tokens(section.text);
    if (running_tokens + section_tokens <= threshold) {
      Section& running = merged.back();
      running.text += SECTION_SEPARATOR;
      running.text += section.text;
      if (!running.heading) {
        running.heading = section.heading;
      }
      running_tokens = tokenizer_->count_tokens(running.text);
    } else {
      merged.push_back(section);
      running_tokens = section_tokens;
    }
  }
  return merged;
}

std::vector<std::string> MarkdownChunker::split_by_paragraphs(const std::string& text) const {
  const size_t max_tokens = static_cast<size_t>(options_.max_chunk_tokens);
  std::vector<std::string> chunks;
  std::string current;

  auto add_paragraph = [&](std::string paragraph) {
    if (strip(paragraph).empty()) {
      return;
    }
    if (current.empty()) {
      current = std::move(paragraph);
      return;
    }
    std::string candidate = current + SECTION_SEPARATOR + paragraph;
    if (tokenizer_->count_tokens(candidate) > max_tokens) {
      chunks.push_back(std::move(current));
      current = std::move(paragraph);
    } else {
      current = std::move(candidate);
    }
  };

  // Paragraphs are separated by runs of two or more newlines
  size_t start = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] != '\n') {
      ++pos;
      continue;
    }
    size_t run_end = pos;
    while (run_end < text.size() && text[run_end] == '\n') {
      ++run_end;
    }
    if (run_end - pos >= 2) {
      add_paragraph(text.substr(start, pos - start));
      start = run_end;
    }
    pos = run_end;
  }
  add_paragraph(text.substr(start));
  if (!current.empty()) {
    chunks.push_back(std::move(current));
  }
  return chunks;
}

}  // namespace lens_core
