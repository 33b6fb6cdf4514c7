#include "bsld/core/config_reader.hpp"

namespace bsld {

ConfigReader::ConfigReader(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto ConfigReader::LoadFromFile(const CanonicalPath& config_path) const
    -> std::optional<BsldConfigFile> {
  logger_->debug("ConfigReader loading config from: {}", config_path);
  return BsldConfigFile::LoadFromFile(config_path, logger_);
}

auto ConfigReader::LoadFromWorkspace(const CanonicalPath& workspace_root) const
    -> std::optional<BsldConfigFile> {
  logger_->debug(
      "ConfigReader loading config from workspace: {}", workspace_root);
  return LoadFromFile(workspace_root / ".bsld");
}

auto ConfigReader::LoadOrDefault(const CanonicalPath& workspace_root) const
    -> BsldConfigFile {
  if (auto config = LoadFromWorkspace(workspace_root)) {
    return std::move(*config);
  }
  logger_->info("Using default configuration for {}", workspace_root);
  return BsldConfigFile::CreateDefault(logger_);
}

}  // namespace bsld
