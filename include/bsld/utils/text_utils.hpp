#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "lsp/basic.hpp"

namespace bsld::utils {

// Decodes one UTF-8 code point starting at `offset` and advances it.
// Malformed bytes decode as themselves, one byte at a time.
auto DecodeUtf8(std::string_view text, std::size_t& offset) -> char32_t;

auto AppendUtf8(std::string& out, char32_t code_point) -> void;

// Locale independent lower-casing of ASCII and Cyrillic letters
[[nodiscard]] auto FoldCase(std::string_view text) -> std::string;

[[nodiscard]] auto EqualsIgnoreCase(std::string_view lhs, std::string_view rhs)
    -> bool;

[[nodiscard]] auto IsIdentifierStart(char32_t c) -> bool;
[[nodiscard]] auto IsIdentifierPart(char32_t c) -> bool;

// Lexicographic (line, character) ordering
[[nodiscard]] auto ComparePositions(
    const lsp::Position& lhs, const lsp::Position& rhs) -> int;

// Half-open: start <= position < end
[[nodiscard]] auto ContainsPosition(
    const lsp::Range& range, const lsp::Position& position) -> bool;

[[nodiscard]] auto ContainsRange(
    const lsp::Range& outer, const lsp::Range& inner) -> bool;

// Strict weak ordering on ranges, start first
struct RangeLess {
  auto operator()(const lsp::Range& lhs, const lsp::Range& rhs) const -> bool;
};

}  // namespace bsld::utils
