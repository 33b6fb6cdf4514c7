#include "bsld/semantic/reference_index.hpp"

#include <algorithm>
#include <limits>

namespace bsld::semantic {

ReferenceIndex::ReferenceIndex(
    std::shared_ptr<const ModuleRegistry> registry,
    std::shared_ptr<spdlog::logger> logger)
    : registry_(std::move(registry)),
      resolver_(registry_),
      logger_(logger ? logger : spdlog::default_logger()) {
}

void ReferenceIndex::InsertEdge(
    const std::string& uri, std::string_view target_module_ref,
    ModuleKind target_module_kind, std::string_view target_symbol_name,
    const lsp::Range& site_range) {
  InsertEdge(
      uri,
      SymbolIdentity(
          std::string(target_module_ref), target_module_kind,
          target_symbol_name),
      site_range);
}

void ReferenceIndex::InsertEdge(
    const std::string& uri, const SymbolIdentity& target,
    const lsp::Range& site_range) {
  std::lock_guard lock(mutex_);
  InsertEdgeLocked(uri, target, site_range);
}

void ReferenceIndex::RetractDocument(const std::string& uri) {
  std::lock_guard lock(mutex_);
  RetractDocumentLocked(uri);
}

void ReferenceIndex::ReplaceDocumentEdges(
    const std::string& uri, std::vector<Edge> edges) {
  std::lock_guard lock(mutex_);
  RetractDocumentLocked(uri);
  for (const auto& edge : edges) {
    InsertEdgeLocked(uri, edge.target, edge.range);
  }
  logger_->debug(
      "ReferenceIndex replaced edges of {} ({} edges, {} total)", uri,
      edges.size(), edge_count_);
}

auto ReferenceIndex::GetReferencesTo(const SymbolIdentity& target) const
    -> std::vector<Reference> {
  std::vector<lsp::Location> sites;
  {
    std::lock_guard lock(mutex_);
    auto it = forward_.find(target);
    if (it == forward_.end()) {
      return {};
    }
    sites = it->second;
  }

  std::vector<Reference> references;
  references.reserve(sites.size());
  for (const auto& site : sites) {
    if (auto reference =
            resolver_.BuildReference(site.uri, site.range, target)) {
      references.push_back(std::move(*reference));
    }
  }
  return references;
}

auto ReferenceIndex::GetReferencesTo(const Symbol& symbol) const
    -> std::vector<Reference> {
  return GetReferencesTo(IdentityOf(symbol));
}

auto ReferenceIndex::GetReferencesFrom(const std::string& uri) const
    -> std::vector<Reference> {
  std::vector<Site> sites;
  {
    std::lock_guard lock(mutex_);
    auto it = reverse_.find(uri);
    if (it == reverse_.end()) {
      return {};
    }
    sites = it->second;
  }
  return ResolveSites(uri, sites);
}

auto ReferenceIndex::GetReferencesFrom(const Symbol& symbol) const
    -> std::vector<Reference> {
  if (symbol.uri.empty()) {
    return {};
  }

  auto references = GetReferencesFrom(symbol.uri);
  std::erase_if(references, [&symbol](const Reference& reference) {
    return !IsSameSymbol(*reference.from, symbol);
  });
  return references;
}

auto ReferenceIndex::GetReferenceAt(
    const std::string& uri, const lsp::Position& position) const
    -> std::optional<Reference> {
  std::optional<Site> hit;
  {
    std::lock_guard lock(mutex_);
    auto doc_it = positional_.find(uri);
    if (doc_it == positional_.end()) {
      return std::nullopt;
    }
    const auto& sites = doc_it->second;

    // First range starting after `position`; candidates precede it
    constexpr auto kMax = std::numeric_limits<int>::max();
    auto it = sites.upper_bound(
        lsp::Range{.start = position, .end = {.line = kMax, .character = kMax}});
    while (it != sites.begin()) {
      --it;
      if (utils::ContainsPosition(it->first, position)) {
        hit.emplace(it->second, it->first);
        break;
      }
    }
  }

  if (!hit) {
    return std::nullopt;
  }
  return resolver_.BuildReference(uri, hit->second, hit->first);
}

auto ReferenceIndex::GetEdgeCount() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return edge_count_;
}

auto ReferenceIndex::GetDocumentCount() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return positional_.size();
}

void ReferenceIndex::InsertEdgeLocked(
    const std::string& uri, const SymbolIdentity& target,
    const lsp::Range& site_range) {
  auto& sites = positional_[uri];
  auto existing = sites.find(site_range);
  if (existing != sites.end()) {
    logger_->debug(
        "ReferenceIndex overwriting edge at {}:{}:{} ({} -> {})", uri,
        site_range.start.line, site_range.start.character, existing->second,
        target);
    auto previous = existing->second;
    RemoveEdgeLocked(uri, previous, site_range);
  }

  forward_[target].push_back(lsp::Location{.uri = uri, .range = site_range});
  reverse_[uri].emplace_back(target, site_range);
  positional_[uri].insert_or_assign(site_range, target);
  ++edge_count_;
}

void ReferenceIndex::RemoveEdgeLocked(
    const std::string& uri, const SymbolIdentity& target,
    const lsp::Range& site_range) {
  auto forward_it = forward_.find(target);
  if (forward_it != forward_.end()) {
    auto& locations = forward_it->second;
    std::erase_if(locations, [&](const lsp::Location& location) {
      return location.uri == uri && location.range == site_range;
    });
    if (locations.empty()) {
      forward_.erase(forward_it);
    }
  }

  auto reverse_it = reverse_.find(uri);
  if (reverse_it != reverse_.end()) {
    std::erase_if(reverse_it->second, [&](const Site& site) {
      return site.second == site_range;
    });
  }

  auto positional_it = positional_.find(uri);
  if (positional_it != positional_.end()) {
    positional_it->second.erase(site_range);
  }
  --edge_count_;
}

void ReferenceIndex::RetractDocumentLocked(const std::string& uri) {
  auto reverse_it = reverse_.find(uri);
  if (reverse_it == reverse_.end()) {
    positional_.erase(uri);
    return;
  }

  for (const auto& [target, range] : reverse_it->second) {
    auto forward_it = forward_.find(target);
    if (forward_it == forward_.end()) {
      continue;
    }
    auto& locations = forward_it->second;
    std::erase_if(locations, [&uri](const lsp::Location& location) {
      return location.uri == uri;
    });
    if (locations.empty()) {
      forward_.erase(forward_it);
    }
  }

  edge_count_ -= reverse_it->second.size();
  reverse_.erase(reverse_it);
  positional_.erase(uri);
}

auto ReferenceIndex::ResolveSites(
    const std::string& uri, const std::vector<Site>& sites) const
    -> std::vector<Reference> {
  std::vector<Reference> references;
  references.reserve(sites.size());
  for (const auto& [target, range] : sites) {
    if (auto reference = resolver_.BuildReference(uri, range, target)) {
      references.push_back(std::move(*reference));
    }
  }
  return references;
}

}  // namespace bsld::semantic
