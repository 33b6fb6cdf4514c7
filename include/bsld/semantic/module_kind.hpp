#pragma once

#include <optional>
#include <string_view>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace bsld::semantic {

// Categories of 1C:Enterprise modules
enum class ModuleKind {
  kCommonModule,
  kObjectModule,
  kManagerModule,
  kFormModule,
  kCommandModule,
  kRecordSetModule,
  kValueManagerModule,
  kSessionModule,
  kManagedApplicationModule,
  kOrdinaryApplicationModule,
  kExternalConnectionModule,
  kHTTPServiceModule,
  kWEBServiceModule,
  kBotModule,
  kUnknownModule,
};

// Canonical name used in configuration and JSON ("CommonModule", ...)
[[nodiscard]] auto ToString(ModuleKind kind) -> std::string_view;

// Designer export file name ("Module.bsl", "Form/Module.bsl", ...)
[[nodiscard]] auto FileNameOf(ModuleKind kind) -> std::string_view;

// Case-insensitive; nullopt for an unknown name
[[nodiscard]] auto TryParseModuleKind(std::string_view name)
    -> std::optional<ModuleKind>;

// Throws std::runtime_error for an unknown name
[[nodiscard]] auto ParseModuleKind(std::string_view name) -> ModuleKind;

void to_json(nlohmann::json& j, const ModuleKind& kind);
void from_json(const nlohmann::json& j, ModuleKind& kind);

}  // namespace bsld::semantic

template <>
struct fmt::formatter<bsld::semantic::ModuleKind>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(bsld::semantic::ModuleKind kind, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(
        bsld::semantic::ToString(kind), ctx);
  }
};
