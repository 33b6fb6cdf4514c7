#include "bsld/semantic/symbol_identity.hpp"

#include <utility>

#include "bsld/utils/text_utils.hpp"

namespace bsld::semantic {

SymbolIdentity::SymbolIdentity(
    std::string module_ref, ModuleKind module_kind,
    std::string_view symbol_name)
    : module_ref_(std::move(module_ref)),
      module_kind_(module_kind),
      symbol_name_(utils::FoldCase(symbol_name)) {
}

SymbolIdentity::SymbolIdentity(
    const ModuleId& module, std::string_view symbol_name)
    : SymbolIdentity(module.mdo_ref, module.kind, symbol_name) {
}

}  // namespace bsld::semantic
