#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

namespace lens_core {

class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  // Number of tokens `text` counts against a chunk budget. Must be
  // deterministic for identical input.
  virtual size_t count_tokens(std::string_view text) const = 0;
};

/**
 * @brief Word-piece style token counter over UTF-8 text.
 *
 * Whitespace only separates tokens. Each punctuation or symbol code point is
 * a token, each CJK/kana/hangul code point is a token, digit runs count one
 * token per group of three, and any other run counts one token per
 * MAX_PIECE_CODEPOINTS code points. Because whitespace is free, counts are
 * additive across whitespace joins.
 *
 * Invalid UTF-8 is replaced with U+FFFD before counting.
 */
class WordPieceTokenizer : public Tokenizer {
 public:
  static constexpr size_t MAX_PIECE_CODEPOINTS = 8;
  static constexpr size_t DIGITS_PER_TOKEN = 3;

  size_t count_tokens(std::string_view text) const override;

 private:
  enum class CharClass { Space, Punct, Digit, Ideograph, Letter };
  static CharClass classify(uint32_t cp);
  static size_t count_valid(std::string_view text);
};

using TokenizerPtr = std::shared_ptr<const Tokenizer>;

}  // namespace lens_core
