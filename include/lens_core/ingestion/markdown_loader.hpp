#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "lens_core/types/document.hpp"

namespace lens_core {

class DocumentLoadError : public std::runtime_error {
 public:
  explicit DocumentLoadError(const std::string &message) : std::runtime_error(message) {}
};

// Reads every *.md / *.markdown file below `root` (recursively, sorted by path).
// external_id is the path relative to root, title is the first level-1 heading
// or the file stem, url_slug is derived from the title.
std::vector<Document> load_markdown_directory(const std::filesystem::path &root);

Document load_markdown_file(const std::filesystem::path &file_path,
                            const std::filesystem::path &root);

std::string extract_title(const std::string &content, const std::string &fallback);

// Lowercase ASCII letters and digits joined by single dashes.
std::string make_url_slug(const std::string &title);

}  // namespace lens_core
