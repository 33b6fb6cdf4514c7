#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include <lsp/basic.hpp>

#include "bsld/syntax/token.hpp"

namespace bsld::syntax {

// Splits BSL source into tokens. Positions count code points. The last
// token is always kEndOfFile.
class Lexer {
 public:
  explicit Lexer(std::string_view source);

  auto Tokenize() -> std::vector<Token>;

  // Tokens without comments, for consumers that only care about code
  static auto Significant(const std::vector<Token>& tokens)
      -> std::vector<Token>;

 private:
  [[nodiscard]] auto AtEnd() const -> bool;
  [[nodiscard]] auto Peek(std::size_t ahead = 0) const -> char32_t;
  auto Advance() -> char32_t;
  [[nodiscard]] auto CurrentPosition() const -> lsp::Position;

  auto LexIdentifier() -> void;
  auto LexNumber() -> void;
  auto LexString() -> void;
  auto LexDate() -> void;
  auto LexToEndOfLine(TokenKind kind) -> void;
  auto LexAnnotation() -> void;

  auto Emit(TokenKind kind, std::size_t start_offset, lsp::Position start)
      -> void;

  std::string_view source_;
  std::size_t offset_ = 0;
  int line_ = 0;
  int character_ = 0;
  std::vector<Token> tokens_;
};

}  // namespace bsld::syntax
