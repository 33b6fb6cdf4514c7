#include "bsld/syntax/keywords.hpp"

#include "bsld/utils/text_utils.hpp"

namespace bsld::syntax {

auto Matches(std::string_view word, const Keyword& keyword) -> bool {
  auto folded = utils::FoldCase(word);
  return folded == utils::FoldCase(keyword.en) ||
         folded == utils::FoldCase(keyword.ru);
}

auto IsKeyword(const Token& token, const Keyword& keyword) -> bool {
  return token.kind == TokenKind::kIdentifier && Matches(token.text, keyword);
}

}  // namespace bsld::syntax
