#include "bsld/syntax/lexer.hpp"

#include <algorithm>
#include <iterator>

#include "bsld/utils/text_utils.hpp"

namespace bsld::syntax {

namespace {

auto IsDigit(char32_t c) -> bool {
  return c >= U'0' && c <= U'9';
}

auto IsLineBreak(char32_t c) -> bool {
  return c == U'\n' || c == U'\r';
}

}  // namespace

Lexer::Lexer(std::string_view source) : source_(source) {
  // UTF-8 byte order mark
  if (source_.starts_with("\xEF\xBB\xBF")) {
    offset_ = 3;
  }
}

auto Lexer::Tokenize() -> std::vector<Token> {
  while (!AtEnd()) {
    auto c = Peek();

    if (c == U' ' || c == U'\t' || c == U'\f' || c == U'\v' ||
        IsLineBreak(c) || c == 0x00A0) {
      Advance();
      continue;
    }

    if (c == U'/' && Peek(1) == U'/') {
      LexToEndOfLine(TokenKind::kComment);
    } else if (c == U'#') {
      LexToEndOfLine(TokenKind::kPreprocessor);
    } else if (c == U'&') {
      LexAnnotation();
    } else if (c == U'"' || c == U'|') {
      // '|' continues a multi-line string after a line break
      LexString();
    } else if (c == U'\'') {
      LexDate();
    } else if (IsDigit(c)) {
      LexNumber();
    } else if (utils::IsIdentifierStart(c)) {
      LexIdentifier();
    } else {
      auto start_offset = offset_;
      auto start = CurrentPosition();
      Advance();
      Emit(TokenKind::kPunctuation, start_offset, start);
    }
  }

  auto end = CurrentPosition();
  tokens_.push_back(
      Token{.kind = TokenKind::kEndOfFile, .text = {}, .range = {end, end}});
  return std::move(tokens_);
}

auto Lexer::Significant(const std::vector<Token>& tokens)
    -> std::vector<Token> {
  std::vector<Token> result;
  result.reserve(tokens.size());
  std::ranges::copy_if(tokens, std::back_inserter(result), [](const Token& t) {
    return t.kind != TokenKind::kComment;
  });
  return result;
}

auto Lexer::AtEnd() const -> bool {
  return offset_ >= source_.size();
}

auto Lexer::Peek(std::size_t ahead) const -> char32_t {
  auto offset = offset_;
  char32_t c = 0;
  for (std::size_t i = 0; i <= ahead; ++i) {
    if (offset >= source_.size()) {
      return 0;
    }
    c = utils::DecodeUtf8(source_, offset);
  }
  return c;
}

auto Lexer::Advance() -> char32_t {
  auto c = utils::DecodeUtf8(source_, offset_);
  if (c == U'\n') {
    ++line_;
    character_ = 0;
  } else if (c == U'\r') {
    // CRLF counts as one line break
    if (!AtEnd() && source_[offset_] == '\n') {
      ++offset_;
    }
    ++line_;
    character_ = 0;
  } else {
    ++character_;
  }
  return c;
}

auto Lexer::CurrentPosition() const -> lsp::Position {
  return lsp::Position{.line = line_, .character = character_};
}

auto Lexer::LexIdentifier() -> void {
  auto start_offset = offset_;
  auto start = CurrentPosition();
  while (!AtEnd() && utils::IsIdentifierPart(Peek())) {
    Advance();
  }
  Emit(TokenKind::kIdentifier, start_offset, start);
}

auto Lexer::LexNumber() -> void {
  auto start_offset = offset_;
  auto start = CurrentPosition();
  while (!AtEnd() && IsDigit(Peek())) {
    Advance();
  }
  if (Peek() == U'.' && IsDigit(Peek(1))) {
    Advance();
    while (!AtEnd() && IsDigit(Peek())) {
      Advance();
    }
  }
  Emit(TokenKind::kNumber, start_offset, start);
}

auto Lexer::LexString() -> void {
  auto start_offset = offset_;
  auto start = CurrentPosition();
  Advance();

  while (!AtEnd()) {
    auto c = Advance();
    if (c == U'"') {
      // "" is an escaped quote
      if (Peek() == U'"') {
        Advance();
        continue;
      }
      break;
    }
    if (IsLineBreak(c)) {
      // A string continues on the next line only after a '|'
      while (!AtEnd() && (Peek() == U' ' || Peek() == U'\t')) {
        Advance();
      }
      if (Peek() == U'|') {
        Advance();
        continue;
      }
      if (Peek(0) == U'/' && Peek(1) == U'/') {
        // Comment line inside a multi-line string
        while (!AtEnd() && !IsLineBreak(Peek())) {
          Advance();
        }
        continue;
      }
      break;
    }
  }
  Emit(TokenKind::kString, start_offset, start);
}

auto Lexer::LexDate() -> void {
  auto start_offset = offset_;
  auto start = CurrentPosition();
  Advance();
  while (!AtEnd()) {
    auto c = Peek();
    if (IsLineBreak(c)) {
      break;
    }
    Advance();
    if (c == U'\'') {
      break;
    }
  }
  Emit(TokenKind::kDate, start_offset, start);
}

auto Lexer::LexToEndOfLine(TokenKind kind) -> void {
  auto start_offset = offset_;
  auto start = CurrentPosition();
  while (!AtEnd() && !IsLineBreak(Peek())) {
    Advance();
  }
  Emit(kind, start_offset, start);
}

auto Lexer::LexAnnotation() -> void {
  auto start_offset = offset_;
  auto start = CurrentPosition();
  Advance();
  while (!AtEnd() && utils::IsIdentifierPart(Peek())) {
    Advance();
  }
  Emit(TokenKind::kAnnotation, start_offset, start);
}

auto Lexer::Emit(TokenKind kind, std::size_t start_offset, lsp::Position start)
    -> void {
  auto text = source_.substr(start_offset, offset_ - start_offset);
  tokens_.push_back(Token{
      .kind = kind,
      .text = std::string(text),
      .range = {.start = start, .end = CurrentPosition()}});
}

}  // namespace bsld::syntax
