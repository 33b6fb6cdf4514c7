#include "bsld/semantic/reference_resolver.hpp"

#include <utility>

namespace bsld::semantic {

ReferenceResolver::ReferenceResolver(
    std::shared_ptr<const ModuleRegistry> registry)
    : registry_(std::move(registry)) {
}

auto ReferenceResolver::ResolveSymbol(const SymbolIdentity& identity) const
    -> std::shared_ptr<const Symbol> {
  auto document = registry_->Resolve(identity.ModuleRef(), identity.Kind());
  if (!document) {
    return nullptr;
  }
  const auto* method = document->Tree().GetMethodSymbol(identity.SymbolName());
  if (method == nullptr) {
    return nullptr;
  }
  return ShareSymbol(document, *method);
}

auto ReferenceResolver::FindFromSymbol(
    const std::string& uri, const lsp::Position& position) const
    -> std::shared_ptr<const Symbol> {
  auto document = registry_->GetDocument(uri);
  if (!document) {
    return nullptr;
  }
  return ShareSymbol(document, document->Tree().FindEnclosingSymbol(position));
}

auto ReferenceResolver::BuildReference(
    const std::string& uri, const lsp::Range& selection_range,
    const SymbolIdentity& target) const -> std::optional<Reference> {
  auto from = FindFromSymbol(uri, selection_range.start);
  if (!from) {
    return std::nullopt;
  }
  auto symbol = ResolveSymbol(target);
  if (!symbol) {
    return std::nullopt;
  }
  return Reference{
      .from = std::move(from),
      .symbol = std::move(symbol),
      .uri = uri,
      .selection_range = selection_range};
}

}  // namespace bsld::semantic
