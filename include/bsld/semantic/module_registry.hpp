#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

#include "bsld/semantic/document_context.hpp"
#include "bsld/semantic/symbol_identity.hpp"

namespace bsld::semantic {

// Maps modules to the documents that implement them. A module is known once
// the workspace layout registers it and resolvable once its document is
// loaded. Thread-safe.
class ModuleRegistry {
 public:
  explicit ModuleRegistry(std::shared_ptr<spdlog::logger> logger = nullptr);

  ModuleRegistry(const ModuleRegistry&) = delete;
  ModuleRegistry(ModuleRegistry&&) = delete;
  auto operator=(const ModuleRegistry&) -> ModuleRegistry& = delete;
  auto operator=(ModuleRegistry&&) -> ModuleRegistry& = delete;
  ~ModuleRegistry() = default;

  // Records that `uri` implements `module`, whether loaded or not
  void RegisterModule(const ModuleId& module, const std::string& uri);

  // Makes `document` the current version for its URI and module
  void Load(std::shared_ptr<const DocumentContext> document);

  // Drops the loaded document; registrations from the layout survive
  void Unload(const std::string& uri);

  [[nodiscard]] auto Resolve(std::string_view mdo_ref, ModuleKind kind) const
      -> std::shared_ptr<const DocumentContext>;
  [[nodiscard]] auto Resolve(const ModuleId& module) const
      -> std::shared_ptr<const DocumentContext>;

  [[nodiscard]] auto GetDocument(const std::string& uri) const
      -> std::shared_ptr<const DocumentContext>;

  [[nodiscard]] auto GetModuleUri(const ModuleId& module) const
      -> std::optional<std::string>;

  [[nodiscard]] auto GetModuleForUri(const std::string& uri) const
      -> std::optional<ModuleId>;

  // Common module by short name ("Utils" for "CommonModule.Utils"),
  // case-insensitive
  [[nodiscard]] auto FindCommonModule(std::string_view name) const
      -> std::optional<ModuleId>;

  // Registered spelling of `mdo_ref` ("catalog.goods" finds "Catalog.Goods"),
  // case-insensitive
  [[nodiscard]] auto FindModule(std::string_view mdo_ref, ModuleKind kind) const
      -> std::optional<ModuleId>;

  [[nodiscard]] auto GetLoadedDocuments() const
      -> std::vector<std::shared_ptr<const DocumentContext>>;

  [[nodiscard]] auto GetModuleCount() const -> std::size_t;

 private:
  void IndexModuleLocked(const ModuleId& module, const std::string& uri);

  void EraseModuleLocked(const ModuleId& module);

  static auto ShortName(std::string_view mdo_ref) -> std::string_view;
  static auto FoldedId(std::string_view mdo_ref, ModuleKind kind) -> ModuleId;

  mutable std::mutex mutex_;

  std::unordered_map<std::string, std::shared_ptr<const DocumentContext>>
      documents_;
  std::unordered_map<ModuleId, std::string> module_uris_;
  std::unordered_map<std::string, ModuleId> uri_modules_;
  std::unordered_set<std::string> registered_uris_;
  std::unordered_map<std::string, ModuleId> common_modules_;
  // Keyed by case-folded mdoRef
  std::unordered_map<ModuleId, ModuleId> folded_modules_;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bsld::semantic
