#include "bsld/semantic/symbol.hpp"

#include "bsld/utils/text_utils.hpp"

namespace bsld::semantic {

auto IsSameSymbol(const Symbol& lhs, const Symbol& rhs) -> bool {
  return lhs.owner == rhs.owner && lhs.kind == rhs.kind &&
         utils::EqualsIgnoreCase(lhs.name, rhs.name);
}

auto IdentityOf(const Symbol& symbol) -> SymbolIdentity {
  return {symbol.owner, symbol.name};
}

auto IsMethod(const Symbol& symbol) -> bool {
  return symbol.kind == lsp::SymbolKind::Method;
}

}  // namespace bsld::semantic
