#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lens_core {

class TextCodecError : public std::runtime_error {
 public:
  explicit TextCodecError(const std::string& message) : std::runtime_error(message) {}
};

// Zstandard framing for text columns stored as BLOBs.
class TextCodec {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @brief Compresses text into a single zstd frame.
   * @param text The text to compress. Empty text encodes to an empty blob.
   * @param level The zstd compression level.
   */
  static std::vector<char> encode(std::string_view text, int level = DEFAULT_LEVEL);

  /**
   * @brief Restores text produced by encode().
   * @throws TextCodecError if the blob is not a zstd frame with a known size.
   */
  static std::string decode(const std::vector<char>& blob);
};

}  // namespace lens_core
