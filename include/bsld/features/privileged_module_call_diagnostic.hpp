#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <lsp/basic.hpp>
#include <spdlog/spdlog.h>

#include "bsld/semantic/reference_index.hpp"

namespace bsld::features {

// Flags every call into a common module listed in PrivilegedModules
class PrivilegedModuleCallDiagnostic {
 public:
  static constexpr std::string_view kCode = "PrivilegedModuleMethodCall";
  static constexpr std::string_view kSource = "bsld";

  PrivilegedModuleCallDiagnostic(
      std::shared_ptr<const semantic::ReferenceIndex> index,
      const std::vector<std::string>& privileged_modules,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto Compute(const std::string& uri) const
      -> std::vector<lsp::Diagnostic>;

  [[nodiscard]] auto IsPrivileged(const semantic::ModuleId& module) const
      -> bool;

  static auto MessageFor(std::string_view method_name) -> std::string;

 private:
  std::shared_ptr<const semantic::ReferenceIndex> index_;
  // Folded module references
  std::unordered_set<std::string> privileged_modules_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bsld::features
