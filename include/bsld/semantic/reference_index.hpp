#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <lsp/basic.hpp>
#include <spdlog/spdlog.h>

#include "bsld/semantic/module_registry.hpp"
#include "bsld/semantic/reference.hpp"
#include "bsld/semantic/reference_resolver.hpp"
#include "bsld/semantic/symbol.hpp"
#include "bsld/semantic/symbol_identity.hpp"
#include "bsld/utils/text_utils.hpp"

namespace bsld::semantic {

// A call site in some document targeting a method identity
struct Edge {
  SymbolIdentity target;
  lsp::Range range;
};

// Cross-module call graph of the workspace.
//
// Each edge is stored in three views that are kept consistent under one
// mutex:
//   forward:    callee identity -> call site locations
//   reverse:    document -> (callee identity, site range), insertion order
//   positional: document -> site range -> callee identity
//
// At most one edge exists per (document, range); inserting at an occupied
// range replaces the previous edge in all views. Stored identities are
// resolved against the registry on every query; unresolvable entries are
// omitted from results.
class ReferenceIndex {
 public:
  explicit ReferenceIndex(
      std::shared_ptr<const ModuleRegistry> registry,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  ReferenceIndex(const ReferenceIndex&) = delete;
  ReferenceIndex(ReferenceIndex&&) = delete;
  auto operator=(const ReferenceIndex&) -> ReferenceIndex& = delete;
  auto operator=(ReferenceIndex&&) -> ReferenceIndex& = delete;
  ~ReferenceIndex() = default;

  void InsertEdge(
      const std::string& uri, std::string_view target_module_ref,
      ModuleKind target_module_kind, std::string_view target_symbol_name,
      const lsp::Range& site_range);

  void InsertEdge(
      const std::string& uri, const SymbolIdentity& target,
      const lsp::Range& site_range);

  // Removes every edge whose site lies in `uri`. Unknown documents are a
  // no-op.
  void RetractDocument(const std::string& uri);

  // Retract and insert as one critical section
  void ReplaceDocumentEdges(const std::string& uri, std::vector<Edge> edges);

  [[nodiscard]] auto GetReferencesTo(const SymbolIdentity& target) const
      -> std::vector<Reference>;
  [[nodiscard]] auto GetReferencesTo(const Symbol& symbol) const
      -> std::vector<Reference>;

  [[nodiscard]] auto GetReferencesFrom(const std::string& uri) const
      -> std::vector<Reference>;

  // References made from within `symbol`, matched by identity
  [[nodiscard]] auto GetReferencesFrom(const Symbol& symbol) const
      -> std::vector<Reference>;

  [[nodiscard]] auto GetReferenceAt(
      const std::string& uri, const lsp::Position& position) const
      -> std::optional<Reference>;

  [[nodiscard]] auto GetEdgeCount() const -> std::size_t;
  [[nodiscard]] auto GetDocumentCount() const -> std::size_t;

 private:
  using SiteMap = std::map<lsp::Range, SymbolIdentity, utils::RangeLess>;
  using Site = std::pair<SymbolIdentity, lsp::Range>;

  void InsertEdgeLocked(
      const std::string& uri, const SymbolIdentity& target,
      const lsp::Range& site_range);
  void RemoveEdgeLocked(
      const std::string& uri, const SymbolIdentity& target,
      const lsp::Range& site_range);
  void RetractDocumentLocked(const std::string& uri);

  [[nodiscard]] auto ResolveSites(
      const std::string& uri, const std::vector<Site>& sites) const
      -> std::vector<Reference>;

  mutable std::mutex mutex_;
  std::unordered_map<SymbolIdentity, std::vector<lsp::Location>> forward_;
  std::unordered_map<std::string, std::vector<Site>> reverse_;
  std::unordered_map<std::string, SiteMap> positional_;
  std::size_t edge_count_ = 0;

  std::shared_ptr<const ModuleRegistry> registry_;
  ReferenceResolver resolver_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bsld::semantic
