#include "bsld/core/bsld_config_file.hpp"

#include <regex>

#include <yaml-cpp/yaml.h>

namespace bsld {

namespace {

// Accepts both a single scalar and a sequence of scalars
auto ReadStringList(const YAML::Node& node) -> std::vector<std::string> {
  std::vector<std::string> values;
  if (node.IsScalar()) {
    values.push_back(node.as<std::string>());
  } else if (node.IsSequence()) {
    for (const auto& item : node) {
      values.push_back(item.as<std::string>());
    }
  }
  return values;
}

}  // namespace

BsldConfigFile::BsldConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto BsldConfigFile::CreateDefault(std::shared_ptr<spdlog::logger> logger)
    -> BsldConfigFile {
  return BsldConfigFile(logger);
}

auto BsldConfigFile::LoadFromFile(
    const CanonicalPath& config_path, std::shared_ptr<spdlog::logger> logger)
    -> std::optional<BsldConfigFile> {
  BsldConfigFile config(logger);

  if (!std::filesystem::exists(config_path.Path())) {
    config.logger_->debug(
        "No .bsld configuration file found at {}", config_path);
    return std::nullopt;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(config_path.String());

    if (yaml["SourceDirs"]) {
      for (const auto& dir : ReadStringList(yaml["SourceDirs"])) {
        config.source_dirs_.emplace_back(dir);
      }
    }

    if (yaml["Modules"]) {
      for (const auto& entry : yaml["Modules"]) {
        if (!entry["Path"] || !entry["Ref"]) {
          config.logger_->warn(
              "Skipping Modules entry without Path or Ref in {}", config_path);
          continue;
        }
        auto kind_name =
            entry["Kind"] ? entry["Kind"].as<std::string>() : "CommonModule";
        auto kind = semantic::TryParseModuleKind(kind_name);
        if (!kind) {
          config.logger_->warn(
              "Skipping Modules entry with unknown Kind '{}' in {}", kind_name,
              config_path);
          continue;
        }
        config.module_mappings_.push_back(ModuleMapping{
            .path = entry["Path"].as<std::string>(),
            .module = {.mdo_ref = entry["Ref"].as<std::string>(), .kind = *kind}});
      }
      config.logger_->debug(
          "Loaded {} module mappings", config.module_mappings_.size());
    }

    if (yaml["PrivilegedModules"]) {
      config.privileged_modules_ = ReadStringList(yaml["PrivilegedModules"]);
    }

    if (yaml["Diagnostics"] &&
        yaml["Diagnostics"]["PrivilegedModuleMethodCall"]) {
      config.privileged_module_call_check_ =
          yaml["Diagnostics"]["PrivilegedModuleMethodCall"].as<bool>();
    }

    if (yaml["If"]) {
      if (yaml["If"]["PathMatch"]) {
        config.path_condition_.path_match =
            ReadStringList(yaml["If"]["PathMatch"]);
        config.logger_->debug(
            "Loaded PathMatch with {} patterns",
            config.path_condition_.path_match.size());
      }
      if (yaml["If"]["PathExclude"]) {
        config.path_condition_.path_exclude =
            ReadStringList(yaml["If"]["PathExclude"]);
        config.logger_->debug(
            "Loaded PathExclude with {} patterns",
            config.path_condition_.path_exclude.size());
      }
    }

    config.logger_->debug("Loaded .bsld configuration from {}", config_path);
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->warn(
        "Error parsing .bsld configuration file: {}", e.what());
    return std::nullopt;
  }
}

auto BsldConfigFile::ShouldIncludeFile(std::string_view relative_path) const
    -> bool {
  if (path_condition_.path_match.empty() &&
      path_condition_.path_exclude.empty()) {
    return true;
  }

  std::string path_str(relative_path);

  try {
    // PathMatch: at least one pattern must match
    if (!path_condition_.path_match.empty()) {
      bool matches_any = false;
      for (const auto& pattern : path_condition_.path_match) {
        if (std::regex_match(path_str, std::regex(pattern))) {
          matches_any = true;
          break;
        }
      }
      if (!matches_any) {
        return false;
      }
    }

    for (const auto& pattern : path_condition_.path_exclude) {
      if (std::regex_match(path_str, std::regex(pattern))) {
        return false;
      }
    }
    return true;

  } catch (const std::regex_error& e) {
    logger_->warn(
        "Invalid regex in path condition ({}), including file by default: {}",
        e.what(), relative_path);
    return true;
  }
}

}  // namespace bsld
