#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <lsp/basic.hpp>

#include "bsld/semantic/symbol.hpp"

namespace bsld::semantic {

// Hierarchy of the symbols declared in one document. The module symbol is
// the root; addresses of symbols are stable for the lifetime of the tree.
class SymbolTree {
 public:
  explicit SymbolTree(Symbol module);

  SymbolTree(const SymbolTree&) = delete;
  SymbolTree(SymbolTree&&) = default;
  auto operator=(const SymbolTree&) -> SymbolTree& = delete;
  auto operator=(SymbolTree&&) -> SymbolTree& = default;
  ~SymbolTree() = default;

  // Appends `symbol` as the last child of `parent` (the module when null)
  auto AddSymbol(Symbol symbol, Symbol* parent = nullptr) -> Symbol*;

  [[nodiscard]] auto GetModule() const -> const Symbol& {
    return *symbols_.front();
  }

  // Stamps the declaring document on every symbol
  void AssignUri(const std::string& uri);

  // Pre-order over every symbol except the module
  [[nodiscard]] auto GetChildrenFlat() const -> std::vector<const Symbol*>;

  [[nodiscard]] auto GetMethods() const -> std::vector<const Symbol*>;

  // Case-insensitive; the first declaration wins on duplicates
  [[nodiscard]] auto GetMethodSymbol(std::string_view name) const
      -> const Symbol*;

  // Innermost symbol whose range contains `position`, skipping regions.
  // Falls back to the module symbol.
  [[nodiscard]] auto FindEnclosingSymbol(const lsp::Position& position) const
      -> const Symbol&;

  // Symbol whose name token contains `position`
  [[nodiscard]] auto FindDeclarationAt(const lsp::Position& position) const
      -> const Symbol*;

 private:
  static void CollectPreOrder(
      const Symbol& symbol, std::vector<const Symbol*>& out);

  std::vector<std::unique_ptr<Symbol>> symbols_;
  std::unordered_map<std::string, const Symbol*> methods_by_name_;
};

}  // namespace bsld::semantic
