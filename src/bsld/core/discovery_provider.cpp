#include "bsld/core/discovery_provider.hpp"

#include <algorithm>
#include <filesystem>

#include "bsld/utils/path_utils.hpp"

namespace bsld {

DiscoveryProvider::DiscoveryProvider(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto DiscoveryProvider::DiscoverFiles(
    const CanonicalPath& workspace_root, const BsldConfigFile& config) const
    -> std::vector<CanonicalPath> {
  std::vector<CanonicalPath> directories;
  if (config.GetSourceDirs().empty()) {
    directories.push_back(workspace_root);
  } else {
    for (const auto& dir : config.GetSourceDirs()) {
      directories.push_back(workspace_root / dir);
    }
  }

  std::vector<CanonicalPath> files;
  for (const auto& directory : directories) {
    for (auto& file : FindSourcesInDirectory(directory)) {
      auto relative = file.RelativeTo(workspace_root);
      if (!config.ShouldIncludeFile(relative)) {
        logger_->debug("DiscoveryProvider excluded {}", relative);
        continue;
      }
      files.push_back(std::move(file));
    }
  }

  // Overlapping source dirs must not yield the same file twice
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());

  logger_->debug("DiscoveryProvider discovered {} files", files.size());
  return files;
}

auto DiscoveryProvider::FindSourcesInDirectory(
    const CanonicalPath& directory) const -> std::vector<CanonicalPath> {
  std::vector<CanonicalPath> sources;

  std::error_code ec;
  if (!std::filesystem::is_directory(directory.Path(), ec)) {
    logger_->warn("DiscoveryProvider: {} is not a directory", directory);
    return sources;
  }

  try {
    for (const auto& entry :
         std::filesystem::recursive_directory_iterator(directory.Path())) {
      if (entry.is_regular_file() && IsBslFile(entry.path())) {
        sources.emplace_back(entry.path());
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    logger_->error(
        "DiscoveryProvider error discovering files in directory {}: {}",
        directory, e.what());
  }

  return sources;
}

}  // namespace bsld
