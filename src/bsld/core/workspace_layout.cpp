#include "bsld/core/workspace_layout.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "bsld/semantic/metadata_types.hpp"

namespace bsld {

using semantic::ModuleId;
using semantic::ModuleKind;

namespace {

// Module files that live directly in <Collection>/<Name>/Ext/
constexpr std::array<ModuleKind, 4> kObjectLevelKinds = {
    ModuleKind::kObjectModule, ModuleKind::kManagerModule,
    ModuleKind::kRecordSetModule, ModuleKind::kValueManagerModule};

// Module files of the configuration itself, in <root>/Ext/
constexpr std::array<ModuleKind, 4> kConfigurationKinds = {
    ModuleKind::kSessionModule, ModuleKind::kManagedApplicationModule,
    ModuleKind::kOrdinaryApplicationModule,
    ModuleKind::kExternalConnectionModule};

struct Parts {
  std::vector<std::string> items;

  // Component `back` positions from the end (0 is the file name)
  [[nodiscard]] auto At(std::size_t back) const -> std::string_view {
    if (back >= items.size()) {
      return {};
    }
    return items[items.size() - 1 - back];
  }
};

auto Split(std::string_view path) -> Parts {
  Parts parts;
  std::size_t start = 0;
  while (start <= path.size()) {
    auto slash = path.find('/', start);
    auto end = slash == std::string_view::npos ? path.size() : slash;
    if (end > start) {
      parts.items.emplace_back(path.substr(start, end - start));
    }
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }
  return parts;
}

auto TypeOfCollection(std::string_view directory) -> std::string_view {
  const auto* collection = semantic::FindCollectionByDirectory(directory);
  return collection != nullptr ? collection->type : std::string_view{};
}

auto FormModule(const Parts& parts) -> std::optional<ModuleId> {
  // .../Forms/<F>/Ext/Form/Module.bsl
  auto form = parts.At(3);
  if (parts.At(4) == "CommonForms") {
    return ModuleId{
        .mdo_ref = fmt::format("CommonForm.{}", form),
        .kind = ModuleKind::kFormModule};
  }
  if (parts.At(4) != "Forms") {
    return std::nullopt;
  }
  auto type = TypeOfCollection(parts.At(6));
  if (type.empty()) {
    return std::nullopt;
  }
  return ModuleId{
      .mdo_ref = fmt::format("{}.{}.Form.{}", type, parts.At(5), form),
      .kind = ModuleKind::kFormModule};
}

auto CommandModule(const Parts& parts) -> std::optional<ModuleId> {
  // .../Commands/<C>/Ext/CommandModule.bsl
  auto command = parts.At(2);
  if (parts.At(3) == "CommonCommands") {
    return ModuleId{
        .mdo_ref = fmt::format("CommonCommand.{}", command),
        .kind = ModuleKind::kCommandModule};
  }
  if (parts.At(3) != "Commands") {
    return std::nullopt;
  }
  auto type = TypeOfCollection(parts.At(5));
  if (type.empty()) {
    return std::nullopt;
  }
  return ModuleId{
      .mdo_ref = fmt::format("{}.{}.Command.{}", type, parts.At(4), command),
      .kind = ModuleKind::kCommandModule};
}

auto ExtModule(const Parts& parts) -> std::optional<ModuleId> {
  auto file = parts.At(0);
  auto name = parts.At(2);
  auto collection = parts.At(3);

  if (file == semantic::FileNameOf(ModuleKind::kCommonModule)) {
    if (collection == "CommonModules") {
      return ModuleId{
          .mdo_ref = fmt::format("CommonModule.{}", name),
          .kind = ModuleKind::kCommonModule};
    }
    if (collection == "HTTPServices") {
      return ModuleId{
          .mdo_ref = fmt::format("HTTPService.{}", name),
          .kind = ModuleKind::kHTTPServiceModule};
    }
    if (collection == "WebServices") {
      return ModuleId{
          .mdo_ref = fmt::format("WebService.{}", name),
          .kind = ModuleKind::kWEBServiceModule};
    }
    if (collection == "Bots") {
      return ModuleId{
          .mdo_ref = fmt::format("Bot.{}", name),
          .kind = ModuleKind::kBotModule};
    }
    return std::nullopt;
  }

  for (auto kind : kObjectLevelKinds) {
    if (file != semantic::FileNameOf(kind)) {
      continue;
    }
    auto type = TypeOfCollection(collection);
    if (type.empty()) {
      return std::nullopt;
    }
    return ModuleId{.mdo_ref = fmt::format("{}.{}", type, name), .kind = kind};
  }

  for (auto kind : kConfigurationKinds) {
    if (file == semantic::FileNameOf(kind)) {
      return ModuleId{.mdo_ref = "Configuration", .kind = kind};
    }
  }
  return std::nullopt;
}

}  // namespace

WorkspaceLayout::WorkspaceLayout(
    CanonicalPath workspace_root, const BsldConfigFile& config)
    : workspace_root_(std::move(workspace_root)) {
  for (const auto& mapping : config.GetModuleMappings()) {
    auto path = std::filesystem::path(mapping.path).lexically_normal();
    explicit_modules_.insert_or_assign(path.generic_string(), mapping.module);
  }
}

auto WorkspaceLayout::ModuleFor(const CanonicalPath& file) const -> ModuleId {
  auto relative = file.RelativeTo(workspace_root_);
  if (auto it = explicit_modules_.find(relative);
      it != explicit_modules_.end()) {
    return it->second;
  }
  return FromDesignerPath(relative);
}

auto WorkspaceLayout::FromDesignerPath(std::string_view relative_path)
    -> ModuleId {
  auto parts = Split(relative_path);

  std::optional<ModuleId> module;
  if (parts.At(0) == "Module.bsl" && parts.At(1) == "Form" &&
      parts.At(2) == "Ext") {
    module = FormModule(parts);
  } else if (
      parts.At(0) == semantic::FileNameOf(ModuleKind::kCommandModule) &&
      parts.At(1) == "Ext") {
    module = CommandModule(parts);
  } else if (parts.At(1) == "Ext") {
    module = ExtModule(parts);
  }

  if (module) {
    return *module;
  }
  // Path without extension keeps same-named files in different folders apart
  return ModuleId{
      .mdo_ref = std::filesystem::path(std::string(relative_path))
                     .replace_extension()
                     .generic_string(),
      .kind = ModuleKind::kUnknownModule};
}

}  // namespace bsld
