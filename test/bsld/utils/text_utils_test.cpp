#include "bsld/utils/text_utils.hpp"

#include <map>
#include <string>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");
  return Catch::Session().run(argc, argv);
}

using bsld::utils::ContainsPosition;
using bsld::utils::ContainsRange;
using bsld::utils::DecodeUtf8;
using bsld::utils::EqualsIgnoreCase;
using bsld::utils::FoldCase;
using bsld::utils::IsIdentifierPart;
using bsld::utils::IsIdentifierStart;
using bsld::utils::RangeLess;

namespace {

auto MakeRange(int start_line, int start_char, int end_line, int end_char)
    -> lsp::Range {
  return lsp::Range{
      .start = {.line = start_line, .character = start_char},
      .end = {.line = end_line, .character = end_char}};
}

}  // namespace

TEST_CASE("FoldCase lowers ASCII and Cyrillic letters", "[text_utils]") {
  CHECK(FoldCase("DoWork") == "dowork");
  CHECK(FoldCase("ОбщегоНазначения") == "общегоназначения");
  CHECK(FoldCase("ЁЖИК") == "ёжик");
  CHECK(FoldCase("Mixed_Имя_123") == "mixed_имя_123");
  CHECK(FoldCase("") == "");
}

TEST_CASE("EqualsIgnoreCase compares folded text", "[text_utils]") {
  CHECK(EqualsIgnoreCase("Процедура", "ПРОЦЕДУРА"));
  CHECK(EqualsIgnoreCase("EndProcedure", "endprocedure"));
  CHECK_FALSE(EqualsIgnoreCase("Procedure", "Procedures"));
}

TEST_CASE("DecodeUtf8 advances by code point", "[text_utils]") {
  std::string_view text = "AЯ€";
  std::size_t offset = 0;

  CHECK(DecodeUtf8(text, offset) == U'A');
  CHECK(offset == 1);
  CHECK(DecodeUtf8(text, offset) == U'Я');
  CHECK(offset == 3);
  CHECK(DecodeUtf8(text, offset) == U'€');
  CHECK(offset == 6);
}

TEST_CASE("DecodeUtf8 consumes malformed bytes one at a time", "[text_utils]") {
  std::string text = "\xFF" "A";
  std::size_t offset = 0;

  CHECK(DecodeUtf8(text, offset) == 0xFF);
  CHECK(offset == 1);
  CHECK(DecodeUtf8(text, offset) == U'A');
}

TEST_CASE("DecodeUtf8 rejects lead bytes above 0xF7", "[text_utils]") {
  std::string text = "\xF8\x80\x80" "A" "\xFF\xBF\xBF\xBF";
  std::size_t offset = 0;

  CHECK(DecodeUtf8(text, offset) == 0xF8);
  CHECK(offset == 1);
  offset = 4;
  CHECK(DecodeUtf8(text, offset) == 0xFF);
  CHECK(offset == 5);
}

TEST_CASE("Identifier characters include Cyrillic letters", "[text_utils]") {
  CHECK(IsIdentifierStart(U'a'));
  CHECK(IsIdentifierStart(U'_'));
  CHECK(IsIdentifierStart(U'Ж'));
  CHECK_FALSE(IsIdentifierStart(U'1'));
  CHECK_FALSE(IsIdentifierStart(U'.'));
  CHECK(IsIdentifierPart(U'1'));
  CHECK_FALSE(IsIdentifierPart(U'('));
}

TEST_CASE("ContainsPosition is half-open", "[text_utils]") {
  auto range = MakeRange(10, 2, 10, 10);

  CHECK(ContainsPosition(range, {.line = 10, .character = 2}));
  CHECK(ContainsPosition(range, {.line = 10, .character = 9}));
  CHECK_FALSE(ContainsPosition(range, {.line = 10, .character = 10}));
  CHECK_FALSE(ContainsPosition(range, {.line = 10, .character = 1}));
  CHECK_FALSE(ContainsPosition(range, {.line = 9, .character = 5}));

  auto multiline = MakeRange(1, 5, 3, 0);
  CHECK(ContainsPosition(multiline, {.line = 2, .character = 100}));
  CHECK_FALSE(ContainsPosition(multiline, {.line = 3, .character = 0}));
}

TEST_CASE("ContainsRange checks both ends", "[text_utils]") {
  auto outer = MakeRange(1, 0, 5, 0);

  CHECK(ContainsRange(outer, MakeRange(2, 0, 3, 4)));
  CHECK(ContainsRange(outer, outer));
  CHECK_FALSE(ContainsRange(outer, MakeRange(0, 5, 2, 0)));
  CHECK_FALSE(ContainsRange(outer, MakeRange(4, 0, 6, 0)));
}

TEST_CASE("RangeLess orders by start, then end", "[text_utils]") {
  std::map<lsp::Range, int, RangeLess> ranges;
  ranges[MakeRange(2, 0, 2, 5)] = 3;
  ranges[MakeRange(1, 4, 1, 8)] = 2;
  ranges[MakeRange(1, 4, 1, 6)] = 1;

  std::vector<int> order;
  for (const auto& [range, value] : ranges) {
    order.push_back(value);
  }
  CHECK(order == std::vector<int>{1, 2, 3});

  CHECK_FALSE(RangeLess{}(MakeRange(1, 4, 1, 6), MakeRange(1, 4, 1, 6)));
}
