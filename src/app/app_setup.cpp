#include "app/app_setup.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string_view>
#include <unordered_map>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "info";
constexpr std::string_view kLogPattern = "[%n][%L] %v";

struct LoggerConfig {
  std::string_view name;
  spdlog::level::level_enum level;
};

auto ParseLogLevel(std::string_view level_str) -> spdlog::level::level_enum {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum>
      kLevelMap = {
          {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},   {"off", spdlog::level::off},
      };

  if (auto it = kLevelMap.find(level_str); it != kLevelMap.end()) {
    return it->second;
  }
  return spdlog::level::info;
}

auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  const char* env_level = std::getenv("SPDLOG_LEVEL");
  return ParseLogLevel(env_level != nullptr ? env_level : kDefaultLogLevel);
}

void ConfigureLogger(
    const std::shared_ptr<spdlog::logger>& logger,
    spdlog::level::level_enum level) {
  logger->set_pattern(std::string(kLogPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
}

}  // namespace

auto ParseOptions(const std::vector<std::string>& args)
    -> std::optional<Options> {
  constexpr std::string_view kWorkspacePrefix = "--workspace=";
  constexpr std::string_view kReferencesPrefix = "--references=";

  Options options;
  for (std::size_t i = 1; i < args.size(); ++i) {
    std::string_view arg = args[i];
    if (arg.starts_with(kWorkspacePrefix)) {
      options.workspace = arg.substr(kWorkspacePrefix.size());
    } else if (arg.starts_with(kReferencesPrefix)) {
      options.references =
          ParseSymbolIdentity(arg.substr(kReferencesPrefix.size()));
      if (!options.references) {
        spdlog::error("Invalid --references value: {}", arg);
        return std::nullopt;
      }
    } else if (arg == "--include-declaration") {
      options.include_declaration = true;
    } else if (arg == "--diagnostics") {
      options.diagnostics = true;
    } else {
      spdlog::error("Unknown argument: {}", arg);
      return std::nullopt;
    }
  }

  if (options.workspace.empty()) {
    return std::nullopt;
  }
  return options;
}

auto ParseSymbolIdentity(std::string_view text)
    -> std::optional<bsld::semantic::SymbolIdentity> {
  auto first = text.find(':');
  auto second =
      first == std::string_view::npos ? first : text.find(':', first + 1);
  if (second == std::string_view::npos) {
    return std::nullopt;
  }

  auto module_ref = text.substr(0, first);
  auto kind = bsld::semantic::TryParseModuleKind(
      text.substr(first + 1, second - first - 1));
  auto method = text.substr(second + 1);
  if (module_ref.empty() || !kind || method.empty()) {
    return std::nullopt;
  }
  return bsld::semantic::SymbolIdentity(std::string(module_ref), *kind, method);
}

auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = GetLogLevelFromEnv();
  spdlog::set_level(user_log_level);

  // stdout carries the JSON result
  constexpr std::array kLoggerConfigs = {
      LoggerConfig{.name = "bsld", .level = spdlog::level::info},
      LoggerConfig{.name = "index", .level = spdlog::level::warn},
  };

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

  for (const auto& config : kLoggerConfigs) {
    auto logger = spdlog::stderr_color_mt(std::string(config.name));
    const auto level =
        (config.name == "bsld") ? user_log_level
                                : std::max(config.level, user_log_level);
    ConfigureLogger(logger, level);
    loggers[std::string(config.name)] = std::move(logger);
  }

  spdlog::set_default_logger(loggers["bsld"]);
  return loggers;
}

}  // namespace app
