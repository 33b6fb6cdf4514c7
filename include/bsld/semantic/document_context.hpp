#pragma once

#include <memory>
#include <string>

#include "bsld/semantic/symbol_identity.hpp"
#include "bsld/semantic/symbol_tree.hpp"

namespace bsld::semantic {

// Immutable result of analyzing one version of a document. Shared between
// the registry and any Reference pointing into its symbols.
class DocumentContext {
 public:
  static auto Create(
      std::string uri, ModuleId module, int version, std::string content,
      SymbolTree symbol_tree) -> std::shared_ptr<const DocumentContext>;

  DocumentContext(
      std::string uri, ModuleId module, int version, std::string content,
      SymbolTree symbol_tree);

  DocumentContext(const DocumentContext&) = delete;
  DocumentContext(DocumentContext&&) = delete;
  auto operator=(const DocumentContext&) -> DocumentContext& = delete;
  auto operator=(DocumentContext&&) -> DocumentContext& = delete;
  ~DocumentContext() = default;

  [[nodiscard]] auto Uri() const -> const std::string& {
    return uri_;
  }
  [[nodiscard]] auto Module() const -> const ModuleId& {
    return module_;
  }
  [[nodiscard]] auto Version() const -> int {
    return version_;
  }
  [[nodiscard]] auto Content() const -> const std::string& {
    return content_;
  }
  [[nodiscard]] auto Tree() const -> const SymbolTree& {
    return symbol_tree_;
  }

 private:
  std::string uri_;
  ModuleId module_;
  int version_;
  std::string content_;
  SymbolTree symbol_tree_;
};

// Shares ownership of `document` while pointing at one of its symbols
[[nodiscard]] auto ShareSymbol(
    const std::shared_ptr<const DocumentContext>& document,
    const Symbol& symbol) -> std::shared_ptr<const Symbol>;

}  // namespace bsld::semantic
