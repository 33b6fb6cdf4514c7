#pragma once

#include <string>
#include <vector>

#include <lsp/basic.hpp>

#include "bsld/features/language_feature_provider.hpp"

namespace bsld::features {

class ReferencesProvider : public LanguageFeatureProvider {
 public:
  using LanguageFeatureProvider::LanguageFeatureProvider;

  // Call sites of the method under the cursor, optionally preceded by its
  // declaration. Only documents currently loaded are searched.
  auto GetReferences(
      const std::string& uri, const lsp::Position& position,
      bool include_declaration) const -> std::vector<lsp::Location>;

  // Call sites of the method named by `target`; empty when the method's
  // module is not loaded
  auto GetReferencesTo(
      const semantic::SymbolIdentity& target, bool include_declaration) const
      -> std::vector<lsp::Location>;

 private:
  auto CollectLocations(
      const semantic::Symbol& method, bool include_declaration) const
      -> std::vector<lsp::Location>;
};

}  // namespace bsld::features
