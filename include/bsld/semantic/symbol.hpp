#pragma once

#include <string>
#include <vector>

#include <lsp/basic.hpp>

#include "bsld/semantic/symbol_identity.hpp"

namespace bsld::semantic {

// A declared symbol of one module: the module itself, a method, a region
// (#Region, kind Namespace) or a module variable
struct Symbol {
  std::string name;
  lsp::SymbolKind kind = lsp::SymbolKind::Module;
  lsp::Range range;
  lsp::Range selection_range;
  ModuleId owner;
  // Declaring document, set once the tree belongs to a DocumentContext
  std::string uri;

  // Methods and module variables
  bool is_export = false;

  // Methods only
  bool is_function = false;
  std::vector<std::string> parameters;
  std::vector<std::string> directives;

  const Symbol* parent = nullptr;
  std::vector<const Symbol*> children;
};

// Two symbols are the same when they share owner module, kind and name
// (case-insensitive), regardless of which document version produced them
[[nodiscard]] auto IsSameSymbol(const Symbol& lhs, const Symbol& rhs) -> bool;

// Identity under which references to this symbol are indexed
[[nodiscard]] auto IdentityOf(const Symbol& symbol) -> SymbolIdentity;

[[nodiscard]] auto IsMethod(const Symbol& symbol) -> bool;

}  // namespace bsld::semantic
