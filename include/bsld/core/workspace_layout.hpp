#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "bsld/core/bsld_config_file.hpp"
#include "bsld/semantic/symbol_identity.hpp"
#include "bsld/utils/canonical_path.hpp"

namespace bsld {

// Decides which module a source file implements. Explicit mappings from the
// config win; otherwise the 1C designer export layout is recognized, e.g.
//   CommonModules/Utils/Ext/Module.bsl -> ("CommonModule.Utils", CommonModule)
// Files outside that layout become (<file stem>, UnknownModule).
class WorkspaceLayout {
 public:
  WorkspaceLayout(CanonicalPath workspace_root, const BsldConfigFile& config);

  [[nodiscard]] auto ModuleFor(const CanonicalPath& file) const
      -> semantic::ModuleId;

  // Takes a path relative to the workspace root with forward slashes
  [[nodiscard]] static auto FromDesignerPath(std::string_view relative_path)
      -> semantic::ModuleId;

 private:
  CanonicalPath workspace_root_;
  std::unordered_map<std::string, semantic::ModuleId> explicit_modules_;
};

}  // namespace bsld
