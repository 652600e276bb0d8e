#include "lens_core/store/text_codec.hpp"

#include <zstd.h>

namespace lens_core {

std::vector<char> TextCodec::encode(std::string_view text, int level) {
  if (text.empty()) {
    return {};
  }
  std::vector<char> blob(ZSTD_compressBound(text.size()));

  size_t const written = ZSTD_compress(blob.data(), blob.size(), text.data(), text.size(), level);
  if (ZSTD_isError(written)) {
    throw TextCodecError("zstd compression failed: " + std::string(ZSTD_getErrorName(written)));
  }
  blob.resize(written);
  return blob;
}

std::string TextCodec::decode(const std::vector<char>& blob) {
  if (blob.empty()) {
    return "";
  }

  unsigned long long const expected = ZSTD_getFrameContentSize(blob.data(), blob.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR || expected == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw TextCodecError("Blob is not a zstd frame with a recorded content size");
  }

  std::string text(expected, '\0');
  size_t const restored = ZSTD_decompress(text.data(), text.size(), blob.data(), blob.size());
  if (ZSTD_isError(restored)) {
    throw TextCodecError("zstd decompression failed: " + std::string(ZSTD_getErrorName(restored)));
  }
  if (restored != expected) {
    throw TextCodecError("zstd frame decoded to " + std::to_string(restored) + " bytes, expected " +
                         std::to_string(expected));
  }
  return text;
}

}  // namespace lens_core
