#include "bsld/features/references_provider.hpp"

#include "bsld/semantic/reference_resolver.hpp"

namespace bsld::features {

auto ReferencesProvider::GetReferences(
    const std::string& uri, const lsp::Position& position,
    bool include_declaration) const -> std::vector<lsp::Location> {
  auto method = FindMethodAt(uri, position);
  if (!method) {
    logger_->debug(
        "ReferencesProvider: no method at {}:{}:{}", uri, position.line,
        position.character);
    return {};
  }
  return CollectLocations(*method, include_declaration);
}

auto ReferencesProvider::GetReferencesTo(
    const semantic::SymbolIdentity& target, bool include_declaration) const
    -> std::vector<lsp::Location> {
  auto method = semantic::ReferenceResolver(registry_).ResolveSymbol(target);
  if (!method) {
    logger_->debug("ReferencesProvider: {} is not resolvable", target);
    return {};
  }
  return CollectLocations(*method, include_declaration);
}

auto ReferencesProvider::CollectLocations(
    const semantic::Symbol& method, bool include_declaration) const
    -> std::vector<lsp::Location> {
  std::vector<lsp::Location> locations;
  if (include_declaration) {
    if (auto declaration = DeclarationOf(method)) {
      locations.push_back(std::move(*declaration));
    }
  }
  for (const auto& reference : index_->GetReferencesTo(method)) {
    locations.push_back(reference.ToLocation());
  }
  return locations;
}

}  // namespace bsld::features
