#pragma once

#include <string>
#include <vector>

#include <lsp/basic.hpp>

#include "bsld/features/language_feature_provider.hpp"

namespace bsld::features {

class DefinitionProvider : public LanguageFeatureProvider {
 public:
  using LanguageFeatureProvider::LanguageFeatureProvider;

  // Declaration of the method called at `position`; empty when the position
  // is not on a resolvable call site
  auto GetDefinitionForUri(
      const std::string& uri, const lsp::Position& position) const
      -> std::vector<lsp::Location>;
};

}  // namespace bsld::features
