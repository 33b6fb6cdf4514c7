#include "bsld/features/definition_provider.hpp"

namespace bsld::features {

auto DefinitionProvider::GetDefinitionForUri(
    const std::string& uri, const lsp::Position& position) const
    -> std::vector<lsp::Location> {
  auto reference = index_->GetReferenceAt(uri, position);
  if (!reference) {
    return {};
  }

  auto declaration = DeclarationOf(*reference->symbol);
  if (!declaration) {
    logger_->warn(
        "DefinitionProvider: resolved {} but its module has no document",
        reference->symbol->name);
    return {};
  }
  return {*declaration};
}

}  // namespace bsld::features
