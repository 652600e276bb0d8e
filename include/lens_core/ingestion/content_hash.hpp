#pragma once

#include <string>

namespace lens_core {

// Lowercase hex SHA-256 of `content`. Throws std::runtime_error if OpenSSL fails.
std::string compute_content_hash(const std::string &content);

}  // namespace lens_core
