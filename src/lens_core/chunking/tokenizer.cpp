#include "lens_core/chunking/tokenizer.hpp"

#include <utf8.h>

#include <iterator>
#include <string>

namespace lens_core {

namespace {

size_t ceil_div(size_t value, size_t divisor) {
  return (value + divisor - 1) / divisor;
}

}  // namespace

WordPieceTokenizer::CharClass WordPieceTokenizer::classify(uint32_t cp) {
  if (cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' || cp == '\v' ||
      cp == 0x85 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
      cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000) {
    return CharClass::Space;
  }
  if (cp >= '0' && cp <= '9') {
    return CharClass::Digit;
  }
  if (cp < 0x80) {
    if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z') || cp == '_') {
      return CharClass::Letter;
    }
    // Remaining printable ASCII is punctuation; control characters count the same way
    return CharClass::Punct;
  }
  // Latin-1 punctuation/symbols, general punctuation, currency, arrows/math, box drawing
  if ((cp >= 0xA1 && cp <= 0xBF) || cp == 0xD7 || cp == 0xF7 || (cp >= 0x2010 && cp <= 0x2027) ||
      (cp >= 0x2030 && cp <= 0x205E) || (cp >= 0x20A0 && cp <= 0x20CF) ||
      (cp >= 0x2190 && cp <= 0x2BFF) || (cp >= 0x3001 && cp <= 0x303F) ||
      (cp >= 0xFF01 && cp <= 0xFF0F) || cp == 0xFFFD || (cp >= 0x1F300 && cp <= 0x1FAFF)) {
    return CharClass::Punct;
  }
  if ((cp >= 0x3040 && cp <= 0x30FF) || (cp >= 0x3400 && cp <= 0x4DBF) ||
      (cp >= 0x4E00 && cp <= 0x9FFF) || (cp >= 0xAC00 && cp <= 0xD7AF) ||
      (cp >= 0xF900 && cp <= 0xFAFF) || (cp >= 0x20000 && cp <= 0x2FA1F)) {
    return CharClass::Ideograph;
  }
  return CharClass::Letter;
}

size_t WordPieceTokenizer::count_tokens(std::string_view text) const {
  if (text.empty()) {
    return 0;
  }
  if (utf8::is_valid(text.begin(), text.end())) {
    return count_valid(text);
  }
  std::string repaired;
  repaired.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(repaired));
  return count_valid(repaired);
}

size_t WordPieceTokenizer::count_valid(std::string_view text) {
  size_t tokens = 0;
  size_t run_length = 0;
  CharClass run_class = CharClass::Space;

  auto close_run = [&]() {
    if (run_length == 0) {
      return;
    }
    if (run_class == CharClass::Digit) {
      tokens += ceil_div(run_length, DIGITS_PER_TOKEN);
    } else {
      tokens += ceil_div(run_length, MAX_PIECE_CODEPOINTS);
    }
    run_length = 0;
  };

  auto it = text.begin();
  while (it != text.end()) {
    uint32_t cp = utf8::next(it, text.end());
    CharClass cls = classify(cp);
    switch (cls) {
      case CharClass::Space:
        close_run();
        break;
      case CharClass::Punct:
      case CharClass::Ideograph:
        close_run();
        ++tokens;
        break;
      case CharClass::Digit:
      case CharClass::Letter:
        if (run_length > 0 && run_class != cls) {
          close_run();
        }
        run_class = cls;
        ++run_length;
        break;
    }
  }
  close_run();
  return tokens;
}

}  // namespace lens_core
