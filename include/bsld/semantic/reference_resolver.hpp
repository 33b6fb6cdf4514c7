#pragma once

#include <memory>
#include <optional>
#include <string>

#include <lsp/basic.hpp>

#include "bsld/semantic/module_registry.hpp"
#include "bsld/semantic/reference.hpp"
#include "bsld/semantic/symbol_identity.hpp"

namespace bsld::semantic {

// Turns stored identities back into live symbols of the currently loaded
// documents. Nothing is cached: every call sees the registry as it is now.
class ReferenceResolver {
 public:
  explicit ReferenceResolver(std::shared_ptr<const ModuleRegistry> registry);

  // Method symbol named by `identity`, or null when its module is not loaded
  // or declares no such method
  [[nodiscard]] auto ResolveSymbol(const SymbolIdentity& identity) const
      -> std::shared_ptr<const Symbol>;

  // Symbol enclosing `position` in the loaded document `uri`
  [[nodiscard]] auto FindFromSymbol(
      const std::string& uri, const lsp::Position& position) const
      -> std::shared_ptr<const Symbol>;

  [[nodiscard]] auto BuildReference(
      const std::string& uri, const lsp::Range& selection_range,
      const SymbolIdentity& target) const -> std::optional<Reference>;

 private:
  std::shared_ptr<const ModuleRegistry> registry_;
};

}  // namespace bsld::semantic
