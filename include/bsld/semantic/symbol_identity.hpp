#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "bsld/semantic/module_kind.hpp"

namespace bsld::semantic {

// Identifies one module of a configuration, e.g. ("CommonModule.Utils",
// CommonModule) or ("Catalog.Goods", ManagerModule)
struct ModuleId {
  std::string mdo_ref;
  ModuleKind kind = ModuleKind::kUnknownModule;

  friend auto operator==(const ModuleId&, const ModuleId&) -> bool = default;
};

// Key of the reference index. The symbol name is folded on construction, so
// two identities built from differently cased names compare equal.
class SymbolIdentity {
 public:
  SymbolIdentity(
      std::string module_ref, ModuleKind module_kind,
      std::string_view symbol_name);
  SymbolIdentity(const ModuleId& module, std::string_view symbol_name);

  [[nodiscard]] auto ModuleRef() const -> const std::string& {
    return module_ref_;
  }
  [[nodiscard]] auto Kind() const -> ModuleKind {
    return module_kind_;
  }
  [[nodiscard]] auto SymbolName() const -> const std::string& {
    return symbol_name_;
  }
  [[nodiscard]] auto Module() const -> ModuleId {
    return ModuleId{.mdo_ref = module_ref_, .kind = module_kind_};
  }

  friend auto operator==(const SymbolIdentity&, const SymbolIdentity&)
      -> bool = default;

 private:
  std::string module_ref_;
  ModuleKind module_kind_;
  std::string symbol_name_;
};

}  // namespace bsld::semantic

template <>
struct std::hash<bsld::semantic::ModuleId> {
  auto operator()(const bsld::semantic::ModuleId& id) const noexcept
      -> std::size_t {
    auto h = std::hash<std::string>{}(id.mdo_ref);
    return h ^ (std::hash<int>{}(static_cast<int>(id.kind)) + 0x9e3779b9 +
                (h << 6) + (h >> 2));
  }
};

template <>
struct std::hash<bsld::semantic::SymbolIdentity> {
  auto operator()(const bsld::semantic::SymbolIdentity& id) const noexcept
      -> std::size_t {
    auto h = std::hash<bsld::semantic::ModuleId>{}(id.Module());
    return h ^ (std::hash<std::string>{}(id.SymbolName()) + 0x9e3779b9 +
                (h << 6) + (h >> 2));
  }
};

template <>
struct fmt::formatter<bsld::semantic::ModuleId> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const bsld::semantic::ModuleId& id, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(
        fmt::format("{}:{}", id.mdo_ref, id.kind), ctx);
  }
};

template <>
struct fmt::formatter<bsld::semantic::SymbolIdentity>
    : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(
      const bsld::semantic::SymbolIdentity& id, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(
        fmt::format("{}:{}.{}", id.ModuleRef(), id.Kind(), id.SymbolName()),
        ctx);
  }
};
