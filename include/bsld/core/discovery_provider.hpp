#pragma once

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "bsld/core/bsld_config_file.hpp"
#include "bsld/utils/canonical_path.hpp"

namespace bsld {

// Finds the .bsl/.os sources of a workspace: every configured source
// directory (the whole workspace when none is configured), filtered by the
// config's path conditions
class DiscoveryProvider {
 public:
  explicit DiscoveryProvider(std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto DiscoverFiles(
      const CanonicalPath& workspace_root, const BsldConfigFile& config) const
      -> std::vector<CanonicalPath>;

 private:
  [[nodiscard]] auto FindSourcesInDirectory(const CanonicalPath& directory) const
      -> std::vector<CanonicalPath>;

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bsld
