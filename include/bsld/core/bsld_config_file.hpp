#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "bsld/semantic/symbol_identity.hpp"
#include "bsld/utils/canonical_path.hpp"

namespace bsld {

// Represents the contents of a .bsld configuration file
class BsldConfigFile {
  using RelativePath = std::filesystem::path;

 public:
  // Explicit file -> module assignment (Modules section)
  struct ModuleMapping {
    RelativePath path;
    semantic::ModuleId module;
  };

  // Path filtering conditions (If block)
  struct PathCondition {
    std::vector<std::string> path_match;    // Include only if matches
    std::vector<std::string> path_exclude;  // Exclude if matches
  };

  explicit BsldConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Configuration used when the workspace has no .bsld file
  static auto CreateDefault(std::shared_ptr<spdlog::logger> logger = nullptr)
      -> BsldConfigFile;

  // Returns std::nullopt if the file doesn't exist or is not valid YAML
  static auto LoadFromFile(
      const CanonicalPath& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<BsldConfigFile>;

  [[nodiscard]] auto GetSourceDirs() const -> const std::vector<RelativePath>& {
    return source_dirs_;
  }

  [[nodiscard]] auto GetModuleMappings() const
      -> const std::vector<ModuleMapping>& {
    return module_mappings_;
  }

  [[nodiscard]] auto GetPrivilegedModules() const
      -> const std::vector<std::string>& {
    return privileged_modules_;
  }

  [[nodiscard]] auto IsPrivilegedModuleCallCheckEnabled() const -> bool {
    return privileged_module_call_check_;
  }

  [[nodiscard]] auto GetPathCondition() const -> const PathCondition& {
    return path_condition_;
  }

  // Takes a path relative to the workspace root with forward slashes
  [[nodiscard]] auto ShouldIncludeFile(std::string_view relative_path) const
      -> bool;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  // Directories scanned for sources; empty scans the whole workspace
  std::vector<RelativePath> source_dirs_;

  std::vector<ModuleMapping> module_mappings_;

  // Module references whose methods need a closer look when called
  std::vector<std::string> privileged_modules_;

  bool privileged_module_call_check_ = true;

  PathCondition path_condition_;
};

}  // namespace bsld
