#pragma once

#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

#include "bsld/core/bsld_config_file.hpp"
#include "bsld/utils/canonical_path.hpp"

namespace bsld {

// Stateless utility for reading .bsld configuration files
class ConfigReader {
 public:
  explicit ConfigReader(std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto LoadFromFile(const CanonicalPath& config_path) const
      -> std::optional<BsldConfigFile>;

  // Looks for .bsld in the workspace root
  [[nodiscard]] auto LoadFromWorkspace(const CanonicalPath& workspace_root)
      const -> std::optional<BsldConfigFile>;

  // Like LoadFromWorkspace, falling back to the default configuration
  [[nodiscard]] auto LoadOrDefault(const CanonicalPath& workspace_root) const
      -> BsldConfigFile;

 private:
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bsld
