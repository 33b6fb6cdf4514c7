#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <lsp/basic.hpp>
#include <lsp/hierarchy.hpp>

#include "bsld/features/language_feature_provider.hpp"

namespace bsld::features {

// Incoming calls are grouped by calling symbol, outgoing calls by callee.
// Items carry the symbol identity in `data` so later requests can find the
// symbol again in a newer document version.
class CallHierarchyProvider : public LanguageFeatureProvider {
 public:
  using LanguageFeatureProvider::LanguageFeatureProvider;

  auto PrepareCallHierarchy(
      const std::string& uri, const lsp::Position& position) const
      -> std::vector<lsp::CallHierarchyItem>;

  auto GetIncomingCalls(const lsp::CallHierarchyItem& item) const
      -> std::vector<lsp::CallHierarchyIncomingCall>;

  auto GetOutgoingCalls(const lsp::CallHierarchyItem& item) const
      -> std::vector<lsp::CallHierarchyOutgoingCall>;

 private:
  [[nodiscard]] auto ToItem(
      const semantic::Symbol& symbol, const std::string& uri) const
      -> lsp::CallHierarchyItem;

  // Current version of the symbol an item was created for
  [[nodiscard]] auto ResolveItem(const lsp::CallHierarchyItem& item) const
      -> std::shared_ptr<const semantic::Symbol>;
};

}  // namespace bsld::features
