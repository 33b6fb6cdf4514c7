#include "bsld/features/call_hierarchy_provider.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace bsld::features {

namespace {

struct CallGroup {
  std::shared_ptr<const semantic::Symbol> symbol;
  std::string uri;
  std::vector<lsp::Range> ranges;
};

}  // namespace

auto CallHierarchyProvider::PrepareCallHierarchy(
    const std::string& uri, const lsp::Position& position) const
    -> std::vector<lsp::CallHierarchyItem> {
  auto method = FindMethodAt(uri, position);
  if (!method) {
    return {};
  }
  auto declaration = DeclarationOf(*method);
  if (!declaration) {
    return {};
  }
  return {ToItem(*method, declaration->uri)};
}

auto CallHierarchyProvider::GetIncomingCalls(
    const lsp::CallHierarchyItem& item) const
    -> std::vector<lsp::CallHierarchyIncomingCall> {
  auto target = ResolveItem(item);
  if (!target) {
    return {};
  }

  std::vector<CallGroup> groups;
  for (auto& reference : index_->GetReferencesTo(*target)) {
    auto group = std::ranges::find_if(groups, [&](const auto& g) {
      return g.uri == reference.uri &&
             semantic::IsSameSymbol(*g.symbol, *reference.from);
    });
    if (group == groups.end()) {
      groups.push_back({std::move(reference.from), reference.uri, {}});
      group = std::prev(groups.end());
    }
    group->ranges.push_back(reference.selection_range);
  }

  std::vector<lsp::CallHierarchyIncomingCall> calls;
  calls.reserve(groups.size());
  for (auto& group : groups) {
    calls.push_back(lsp::CallHierarchyIncomingCall{
        .from = ToItem(*group.symbol, group.uri),
        .fromRanges = std::move(group.ranges)});
  }
  return calls;
}

auto CallHierarchyProvider::GetOutgoingCalls(
    const lsp::CallHierarchyItem& item) const
    -> std::vector<lsp::CallHierarchyOutgoingCall> {
  auto source = ResolveItem(item);
  if (!source) {
    return {};
  }

  std::vector<CallGroup> groups;
  for (auto& reference : index_->GetReferencesFrom(*source)) {
    auto group = std::ranges::find_if(groups, [&](const auto& g) {
      return semantic::IsSameSymbol(*g.symbol, *reference.symbol);
    });
    if (group == groups.end()) {
      auto declaration = DeclarationOf(*reference.symbol);
      if (!declaration) {
        continue;
      }
      groups.push_back({std::move(reference.symbol), declaration->uri, {}});
      group = std::prev(groups.end());
    }
    group->ranges.push_back(reference.selection_range);
  }

  std::vector<lsp::CallHierarchyOutgoingCall> calls;
  calls.reserve(groups.size());
  for (auto& group : groups) {
    calls.push_back(lsp::CallHierarchyOutgoingCall{
        .to = ToItem(*group.symbol, group.uri),
        .fromRanges = std::move(group.ranges)});
  }
  return calls;
}

auto CallHierarchyProvider::ToItem(
    const semantic::Symbol& symbol, const std::string& uri) const
    -> lsp::CallHierarchyItem {
  return lsp::CallHierarchyItem{
      .name = symbol.name,
      .kind = symbol.kind,
      .tags = std::nullopt,
      .detail = symbol.owner.mdo_ref,
      .uri = uri,
      .range = symbol.range,
      .selectionRange = symbol.selection_range,
      .data = nlohmann::json{
          {"moduleRef", symbol.owner.mdo_ref},
          {"moduleKind", symbol.owner.kind},
          {"name", symbol.name},
          {"kind", symbol.kind}}};
}

auto CallHierarchyProvider::ResolveItem(
    const lsp::CallHierarchyItem& item) const
    -> std::shared_ptr<const semantic::Symbol> {
  if (!item.data || !item.data->contains("moduleRef")) {
    auto document = registry_->GetDocument(item.uri);
    if (!document) {
      return nullptr;
    }
    if (item.kind == lsp::SymbolKind::Module) {
      return semantic::ShareSymbol(document, document->Tree().GetModule());
    }
    const auto* declared =
        document->Tree().FindDeclarationAt(item.selectionRange.start);
    if (declared == nullptr) {
      return nullptr;
    }
    return semantic::ShareSymbol(document, *declared);
  }

  const auto& data = *item.data;
  // Throws std::runtime_error for a malformed module kind
  semantic::ModuleId module{
      .mdo_ref = data.at("moduleRef").get<std::string>(),
      .kind = data.at("moduleKind").get<semantic::ModuleKind>()};

  auto document = registry_->Resolve(module);
  if (!document) {
    return nullptr;
  }
  if (item.kind == lsp::SymbolKind::Module) {
    return semantic::ShareSymbol(document, document->Tree().GetModule());
  }
  const auto* method =
      document->Tree().GetMethodSymbol(data.at("name").get<std::string>());
  if (method == nullptr) {
    return nullptr;
  }
  return semantic::ShareSymbol(document, *method);
}

}  // namespace bsld::features
