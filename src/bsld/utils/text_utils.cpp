#include "bsld/utils/text_utils.hpp"

namespace bsld::utils {

auto DecodeUtf8(std::string_view text, std::size_t& offset) -> char32_t {
  auto lead = static_cast<unsigned char>(text[offset]);
  std::size_t length = 1;
  char32_t code_point = lead;

  if (lead >= 0xF8) {
    // 0xF8-0xFF never start a sequence
  } else if (lead >= 0xF0) {
    length = 4;
    code_point = lead & 0x07;
  } else if (lead >= 0xE0) {
    length = 3;
    code_point = lead & 0x0F;
  } else if (lead >= 0xC0) {
    length = 2;
    code_point = lead & 0x1F;
  }

  if (length == 1 || offset + length > text.size()) {
    ++offset;
    return lead;
  }

  for (std::size_t i = 1; i < length; ++i) {
    auto next = static_cast<unsigned char>(text[offset + i]);
    if ((next & 0xC0) != 0x80) {
      ++offset;
      return lead;
    }
    code_point = (code_point << 6) | (next & 0x3F);
  }

  offset += length;
  return code_point;
}

auto AppendUtf8(std::string& out, char32_t code_point) -> void {
  if (code_point < 0x80) {
    out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    out += static_cast<char>(0xC0 | (code_point >> 6));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    out += static_cast<char>(0xE0 | (code_point >> 12));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (code_point >> 18));
    out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

namespace {

auto FoldCodePoint(char32_t c) -> char32_t {
  if (c >= U'A' && c <= U'Z') {
    return c + 0x20;
  }
  // А..Я
  if (c >= 0x0410 && c <= 0x042F) {
    return c + 0x20;
  }
  // Ѐ..Џ, including Ё
  if (c >= 0x0400 && c <= 0x040F) {
    return c + 0x50;
  }
  return c;
}

}  // namespace

auto FoldCase(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  std::size_t offset = 0;
  while (offset < text.size()) {
    auto start = offset;
    auto c = DecodeUtf8(text, offset);
    auto folded = FoldCodePoint(c);
    if (folded == c) {
      result.append(text.substr(start, offset - start));
    } else {
      AppendUtf8(result, folded);
    }
  }
  return result;
}

auto EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) -> bool {
  return FoldCase(lhs) == FoldCase(rhs);
}

auto IsIdentifierStart(char32_t c) -> bool {
  return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') || c == U'_' ||
         (c >= 0x0400 && c <= 0x04FF);
}

auto IsIdentifierPart(char32_t c) -> bool {
  return IsIdentifierStart(c) || (c >= U'0' && c <= U'9');
}

auto ComparePositions(const lsp::Position& lhs, const lsp::Position& rhs)
    -> int {
  if (lhs.line != rhs.line) {
    return lhs.line < rhs.line ? -1 : 1;
  }
  if (lhs.character != rhs.character) {
    return lhs.character < rhs.character ? -1 : 1;
  }
  return 0;
}

auto ContainsPosition(const lsp::Range& range, const lsp::Position& position)
    -> bool {
  return ComparePositions(range.start, position) <= 0 &&
         ComparePositions(position, range.end) < 0;
}

auto ContainsRange(const lsp::Range& outer, const lsp::Range& inner) -> bool {
  return ComparePositions(outer.start, inner.start) <= 0 &&
         ComparePositions(inner.end, outer.end) <= 0;
}

auto RangeLess::operator()(const lsp::Range& lhs, const lsp::Range& rhs) const
    -> bool {
  auto by_start = ComparePositions(lhs.start, rhs.start);
  if (by_start != 0) {
    return by_start < 0;
  }
  return ComparePositions(lhs.end, rhs.end) < 0;
}

}  // namespace bsld::utils
