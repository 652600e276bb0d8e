#include "lens_core/ingestion/markdown_loader.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include "lens_core/chunking/markdown_chunker.hpp"

namespace fs = std::filesystem;

namespace lens_core {

namespace {

bool is_markdown_file(const fs::path &path) {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension == ".md" || extension == ".markdown";
}

}  // namespace

std::string extract_title(const std::string &content, const std::string &fallback) {
  std::istringstream stream(content);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    // "# " followed by at least one more character; "##" is a section heading
    if (line.size() >= 3 && line[0] == '#' &&
        std::isspace(static_cast<unsigned char>(line[1]))) {
      std::string title = strip(line.substr(2));
      if (!title.empty()) {
        return title;
      }
    }
  }
  return fallback;
}

std::string make_url_slug(const std::string &title) {
  std::string slug;
  bool pending_dash = false;
  for (unsigned char c : title) {
    if (std::isalnum(c) && c < 0x80) {
      if (pending_dash && !slug.empty()) {
        slug.push_back('-');
      }
      slug.push_back(static_cast<char>(std::tolower(c)));
      pending_dash = false;
    } else {
      pending_dash = true;
    }
  }
  return slug;
}

Document load_markdown_file(const fs::path &file_path, const fs::path &root) {
  std::ifstream file(file_path, std::ios::binary);
  if (!file.is_open()) {
    throw DocumentLoadError("Failed to open " + file_path.string());
  }
  std::ostringstream content;
  content << file.rdbuf();

  Document document;
  document.external_id = fs::relative(file_path, root).generic_string();
  document.content = content.str();
  document.title = extract_title(document.content, file_path.stem().string());
  document.url_slug = make_url_slug(document.title);
  return document;
}

std::vector<Document> load_markdown_directory(const fs::path &root) {
  if (!fs::exists(root) || !fs::is_directory(root)) {
    throw DocumentLoadError("Not a directory: " + root.string());
  }

  std::vector<fs::path> files;
  for (const auto &entry : fs::recursive_directory_iterator(root)) {
    if (entry.is_regular_file() && is_markdown_file(entry.path())) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  std::vector<Document> documents;
  documents.reserve(files.size());
  for (const auto &file_path : files) {
    documents.push_back(load_markdown_file(file_path, root));
  }
  return documents;
}

}  // namespace lens_core
