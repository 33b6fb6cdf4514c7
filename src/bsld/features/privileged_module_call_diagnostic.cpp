#include "bsld/features/privileged_module_call_diagnostic.hpp"

#include <fmt/format.h>

#include "bsld/utils/text_utils.hpp"

namespace bsld::features {

PrivilegedModuleCallDiagnostic::PrivilegedModuleCallDiagnostic(
    std::shared_ptr<const semantic::ReferenceIndex> index,
    const std::vector<std::string>& privileged_modules,
    std::shared_ptr<spdlog::logger> logger)
    : index_(std::move(index)),
      logger_(logger ? logger : spdlog::default_logger()) {
  for (const auto& module : privileged_modules) {
    privileged_modules_.insert(utils::FoldCase(module));
  }
}

auto PrivilegedModuleCallDiagnostic::Compute(const std::string& uri) const
    -> std::vector<lsp::Diagnostic> {
  std::vector<lsp::Diagnostic> diagnostics;
  if (privileged_modules_.empty()) {
    return diagnostics;
  }

  for (const auto& reference : index_->GetReferencesFrom(uri)) {
    const auto& target = *reference.symbol;
    if (!semantic::IsMethod(target) || !IsPrivileged(target.owner)) {
      continue;
    }
    diagnostics.push_back(lsp::Diagnostic{
        .range = reference.selection_range,
        .severity = lsp::DiagnosticSeverity::Warning,
        .code = std::string(kCode),
        .source = std::string(kSource),
        .message = MessageFor(target.name)});
  }

  logger_->debug(
      "PrivilegedModuleCallDiagnostic: {} issues in {}", diagnostics.size(),
      uri);
  return diagnostics;
}

auto PrivilegedModuleCallDiagnostic::IsPrivileged(
    const semantic::ModuleId& module) const -> bool {
  return module.kind == semantic::ModuleKind::kCommonModule &&
         privileged_modules_.contains(utils::FoldCase(module.mdo_ref));
}

auto PrivilegedModuleCallDiagnostic::MessageFor(std::string_view method_name)
    -> std::string {
  return fmt::format(
      "Check the privileged module method call \"{}\"", method_name);
}

}  // namespace bsld::features
