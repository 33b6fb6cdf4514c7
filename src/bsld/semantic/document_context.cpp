#include "bsld/semantic/document_context.hpp"

#include <utility>

namespace bsld::semantic {

auto DocumentContext::Create(
    std::string uri, ModuleId module, int version, std::string content,
    SymbolTree symbol_tree) -> std::shared_ptr<const DocumentContext> {
  return std::make_shared<const DocumentContext>(
      std::move(uri), std::move(module), version, std::move(content),
      std::move(symbol_tree));
}

DocumentContext::DocumentContext(
    std::string uri, ModuleId module, int version, std::string content,
    SymbolTree symbol_tree)
    : uri_(std::move(uri)),
      module_(std::move(module)),
      version_(version),
      content_(std::move(content)),
      symbol_tree_(std::move(symbol_tree)) {
  symbol_tree_.AssignUri(uri_);
}

auto ShareSymbol(
    const std::shared_ptr<const DocumentContext>& document,
    const Symbol& symbol) -> std::shared_ptr<const Symbol> {
  return {document, &symbol};
}

}  // namespace bsld::semantic
