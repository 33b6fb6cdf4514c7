#include "bsld/semantic/module_kind.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "bsld/utils/text_utils.hpp"

namespace bsld::semantic {

namespace {

struct ModuleKindInfo {
  ModuleKind kind;
  std::string_view name;
  std::string_view file_name;
};

constexpr std::array<ModuleKindInfo, 15> kModuleKinds = {{
    {ModuleKind::kCommonModule, "CommonModule", "Module.bsl"},
    {ModuleKind::kObjectModule, "ObjectModule", "ObjectModule.bsl"},
    {ModuleKind::kManagerModule, "ManagerModule", "ManagerModule.bsl"},
    {ModuleKind::kFormModule, "FormModule", "Form/Module.bsl"},
    {ModuleKind::kCommandModule, "CommandModule", "CommandModule.bsl"},
    {ModuleKind::kRecordSetModule, "RecordSetModule", "RecordSetModule.bsl"},
    {ModuleKind::kValueManagerModule, "ValueManagerModule",
     "ValueManagerModule.bsl"},
    {ModuleKind::kSessionModule, "SessionModule", "SessionModule.bsl"},
    {ModuleKind::kManagedApplicationModule, "ManagedApplicationModule",
     "ManagedApplicationModule.bsl"},
    {ModuleKind::kOrdinaryApplicationModule, "OrdinaryApplicationModule",
     "OrdinaryApplicationModule.bsl"},
    {ModuleKind::kExternalConnectionModule, "ExternalConnectionModule",
     "ExternalConnectionModule.bsl"},
    {ModuleKind::kHTTPServiceModule, "HTTPServiceModule", "Module.bsl"},
    {ModuleKind::kWEBServiceModule, "WEBServiceModule", "Module.bsl"},
    {ModuleKind::kBotModule, "BotModule", "Module.bsl"},
    {ModuleKind::kUnknownModule, "UnknownModule", ""},
}};

auto InfoOf(ModuleKind kind) -> const ModuleKindInfo& {
  for (const auto& info : kModuleKinds) {
    if (info.kind == kind) {
      return info;
    }
  }
  throw std::runtime_error(
      fmt::format("Invalid module kind: {}", std::to_underlying(kind)));
}

}  // namespace

auto ToString(ModuleKind kind) -> std::string_view {
  return InfoOf(kind).name;
}

auto FileNameOf(ModuleKind kind) -> std::string_view {
  return InfoOf(kind).file_name;
}

auto TryParseModuleKind(std::string_view name) -> std::optional<ModuleKind> {
  auto folded = utils::FoldCase(name);
  for (const auto& info : kModuleKinds) {
    if (utils::FoldCase(info.name) == folded) {
      return info.kind;
    }
  }
  return std::nullopt;
}

auto ParseModuleKind(std::string_view name) -> ModuleKind {
  auto kind = TryParseModuleKind(name);
  if (!kind) {
    throw std::runtime_error(fmt::format("Invalid module kind: {}", name));
  }
  return *kind;
}

void to_json(nlohmann::json& j, const ModuleKind& kind) {
  j = std::string(ToString(kind));
}

void from_json(const nlohmann::json& j, ModuleKind& kind) {
  if (!j.is_string()) {
    throw std::runtime_error("Invalid module kind");
  }
  kind = ParseModuleKind(j.get<std::string>());
}

}  // namespace bsld::semantic
