#include "bsld/semantic/symbol_tree.hpp"

#include "bsld/utils/text_utils.hpp"

namespace bsld::semantic {

SymbolTree::SymbolTree(Symbol module) {
  module.parent = nullptr;
  module.children.clear();
  symbols_.push_back(std::make_unique<Symbol>(std::move(module)));
}

auto SymbolTree::AddSymbol(Symbol symbol, Symbol* parent) -> Symbol* {
  Symbol* owner = parent != nullptr ? parent : symbols_.front().get();
  symbol.parent = owner;
  symbol.children.clear();

  auto& stored =
      symbols_.emplace_back(std::make_unique<Symbol>(std::move(symbol)));
  owner->children.push_back(stored.get());

  if (IsMethod(*stored)) {
    methods_by_name_.try_emplace(utils::FoldCase(stored->name), stored.get());
  }
  return stored.get();
}

void SymbolTree::AssignUri(const std::string& uri) {
  for (auto& symbol : symbols_) {
    symbol->uri = uri;
  }
}

auto SymbolTree::GetChildrenFlat() const -> std::vector<const Symbol*> {
  std::vector<const Symbol*> result;
  result.reserve(symbols_.size() - 1);
  for (const auto* child : GetModule().children) {
    CollectPreOrder(*child, result);
  }
  return result;
}

void SymbolTree::CollectPreOrder(
    const Symbol& symbol, std::vector<const Symbol*>& out) {
  out.push_back(&symbol);
  for (const auto* child : symbol.children) {
    CollectPreOrder(*child, out);
  }
}

auto SymbolTree::GetMethods() const -> std::vector<const Symbol*> {
  std::vector<const Symbol*> methods;
  for (const auto* symbol : GetChildrenFlat()) {
    if (IsMethod(*symbol)) {
      methods.push_back(symbol);
    }
  }
  return methods;
}

auto SymbolTree::GetMethodSymbol(std::string_view name) const
    -> const Symbol* {
  auto it = methods_by_name_.find(utils::FoldCase(name));
  if (it == methods_by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

auto SymbolTree::FindEnclosingSymbol(const lsp::Position& position) const
    -> const Symbol& {
  const Symbol* current = &GetModule();
  const Symbol* best = current;

  // Regions are transparent: descend through them but never report them
  bool descended = true;
  while (descended) {
    descended = false;
    for (const auto* child : current->children) {
      if (child->kind == lsp::SymbolKind::Variable) {
        continue;
      }
      if (utils::ContainsPosition(child->range, position)) {
        current = child;
        if (child->kind != lsp::SymbolKind::Namespace) {
          best = child;
        }
        descended = true;
        break;
      }
    }
  }
  return *best;
}

auto SymbolTree::FindDeclarationAt(const lsp::Position& position) const
    -> const Symbol* {
  for (const auto* symbol : GetChildrenFlat()) {
    if (utils::ContainsPosition(symbol->selection_range, position)) {
      return symbol;
    }
  }
  return nullptr;
}

}  // namespace bsld::semantic
