#include "bsld/features/language_feature_provider.hpp"

namespace bsld::features {

auto LanguageFeatureProvider::FindMethodAt(
    const std::string& uri, const lsp::Position& position) const
    -> std::shared_ptr<const semantic::Symbol> {
  if (auto reference = index_->GetReferenceAt(uri, position)) {
    return reference->symbol;
  }

  auto document = registry_->GetDocument(uri);
  if (!document) {
    return nullptr;
  }
  const auto* declared = document->Tree().FindDeclarationAt(position);
  if (declared == nullptr || !semantic::IsMethod(*declared)) {
    return nullptr;
  }
  return semantic::ShareSymbol(document, *declared);
}

auto LanguageFeatureProvider::DeclarationOf(
    const semantic::Symbol& symbol) const -> std::optional<lsp::Location> {
  if (symbol.uri.empty()) {
    return std::nullopt;
  }
  return lsp::Location{.uri = symbol.uri, .range = symbol.selection_range};
}

}  // namespace bsld::features
