#include "bsld/semantic/module_registry.hpp"

#include <utility>

#include "bsld/utils/text_utils.hpp"

namespace bsld::semantic {

ModuleRegistry::ModuleRegistry(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

void ModuleRegistry::RegisterModule(
    const ModuleId& module, const std::string& uri) {
  std::lock_guard lock(mutex_);
  IndexModuleLocked(module, uri);
  registered_uris_.insert(uri);
  logger_->debug("ModuleRegistry registered {} -> {}", module, uri);
}

void ModuleRegistry::Load(std::shared_ptr<const DocumentContext> document) {
  std::lock_guard lock(mutex_);
  const auto& uri = document->Uri();

  auto previous = uri_modules_.find(uri);
  if (previous != uri_modules_.end() &&
      previous->second != document->Module()) {
    // The document now implements another module
    EraseModuleLocked(previous->second);
  }

  IndexModuleLocked(document->Module(), uri);
  logger_->debug(
      "ModuleRegistry loaded {} (version {})", uri, document->Version());
  documents_[uri] = std::move(document);
}

void ModuleRegistry::Unload(const std::string& uri) {
  std::lock_guard lock(mutex_);
  if (documents_.erase(uri) == 0) {
    return;
  }
  logger_->debug("ModuleRegistry unloaded {}", uri);

  if (registered_uris_.contains(uri)) {
    return;
  }
  auto module_it = uri_modules_.find(uri);
  if (module_it == uri_modules_.end()) {
    return;
  }
  const auto module = module_it->second;
  uri_modules_.erase(module_it);

  auto owner = module_uris_.find(module);
  if (owner != module_uris_.end() && owner->second == uri) {
    EraseModuleLocked(module);
  }
}

auto ModuleRegistry::Resolve(std::string_view mdo_ref, ModuleKind kind) const
    -> std::shared_ptr<const DocumentContext> {
  return Resolve(ModuleId{.mdo_ref = std::string(mdo_ref), .kind = kind});
}

auto ModuleRegistry::Resolve(const ModuleId& module) const
    -> std::shared_ptr<const DocumentContext> {
  std::lock_guard lock(mutex_);
  auto uri_it = module_uris_.find(module);
  if (uri_it == module_uris_.end()) {
    return nullptr;
  }
  auto doc_it = documents_.find(uri_it->second);
  if (doc_it == documents_.end()) {
    return nullptr;
  }
  return doc_it->second;
}

auto ModuleRegistry::GetDocument(const std::string& uri) const
    -> std::shared_ptr<const DocumentContext> {
  std::lock_guard lock(mutex_);
  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    return nullptr;
  }
  return it->second;
}

auto ModuleRegistry::GetModuleUri(const ModuleId& module) const
    -> std::optional<std::string> {
  std::lock_guard lock(mutex_);
  auto it = module_uris_.find(module);
  if (it == module_uris_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ModuleRegistry::GetModuleForUri(const std::string& uri) const
    -> std::optional<ModuleId> {
  std::lock_guard lock(mutex_);
  auto it = uri_modules_.find(uri);
  if (it == uri_modules_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ModuleRegistry::FindCommonModule(std::string_view name) const
    -> std::optional<ModuleId> {
  std::lock_guard lock(mutex_);
  auto it = common_modules_.find(utils::FoldCase(name));
  if (it == common_modules_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ModuleRegistry::FindModule(std::string_view mdo_ref, ModuleKind kind) const
    -> std::optional<ModuleId> {
  std::lock_guard lock(mutex_);
  auto it = folded_modules_.find(FoldedId(mdo_ref, kind));
  if (it == folded_modules_.end()) {
    return std::nullopt;
  }
  return it->second;
}

auto ModuleRegistry::GetLoadedDocuments() const
    -> std::vector<std::shared_ptr<const DocumentContext>> {
  std::lock_guard lock(mutex_);
  std::vector<std::shared_ptr<const DocumentContext>> result;
  result.reserve(documents_.size());
  for (const auto& [uri, document] : documents_) {
    result.push_back(document);
  }
  return result;
}

auto ModuleRegistry::GetModuleCount() const -> std::size_t {
  std::lock_guard lock(mutex_);
  return module_uris_.size();
}

void ModuleRegistry::IndexModuleLocked(
    const ModuleId& module, const std::string& uri) {
  auto [it, inserted] = module_uris_.try_emplace(module, uri);
  if (!inserted && it->second != uri) {
    logger_->warn(
        "ModuleRegistry: {} is implemented by both {} and {}, using the "
        "latter",
        module, it->second, uri);
    it->second = uri;
  }
  uri_modules_.insert_or_assign(uri, module);
  folded_modules_.insert_or_assign(
      FoldedId(module.mdo_ref, module.kind), module);

  if (module.kind == ModuleKind::kCommonModule) {
    common_modules_.insert_or_assign(
        utils::FoldCase(ShortName(module.mdo_ref)), module);
  }
}

void ModuleRegistry::EraseModuleLocked(const ModuleId& module) {
  module_uris_.erase(module);
  auto folded = folded_modules_.find(FoldedId(module.mdo_ref, module.kind));
  if (folded != folded_modules_.end() && folded->second == module) {
    folded_modules_.erase(folded);
  }
  if (module.kind == ModuleKind::kCommonModule) {
    auto common =
        common_modules_.find(utils::FoldCase(ShortName(module.mdo_ref)));
    if (common != common_modules_.end() && common->second == module) {
      common_modules_.erase(common);
    }
  }
}

auto ModuleRegistry::FoldedId(std::string_view mdo_ref, ModuleKind kind)
    -> ModuleId {
  return ModuleId{.mdo_ref = utils::FoldCase(mdo_ref), .kind = kind};
}

auto ModuleRegistry::ShortName(std::string_view mdo_ref) -> std::string_view {
  auto dot = mdo_ref.rfind('.');
  if (dot == std::string_view::npos) {
    return mdo_ref;
  }
  return mdo_ref.substr(dot + 1);
}

}  // namespace bsld::semantic
