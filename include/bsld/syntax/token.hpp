#pragma once

#include <string>

#include <lsp/basic.hpp>

namespace bsld::syntax {

enum class TokenKind {
  kIdentifier,
  kNumber,
  kString,
  kDate,
  kPunctuation,
  kComment,
  kPreprocessor,
  kAnnotation,
  kEndOfFile,
};

struct Token {
  TokenKind kind;
  // Source text; for preprocessor lines and annotations the leading '#'/'&'
  // is included
  std::string text;
  lsp::Range range;

  [[nodiscard]] auto Is(TokenKind k) const -> bool {
    return kind == k;
  }
  [[nodiscard]] auto IsPunctuation(char c) const -> bool {
    return kind == TokenKind::kPunctuation && text.size() == 1 &&
           text[0] == c;
  }
};

}  // namespace bsld::syntax
