#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "bsld/semantic/symbol_identity.hpp"

namespace app {

struct Options {
  std::string workspace;
  std::optional<bsld::semantic::SymbolIdentity> references;
  bool include_declaration = false;
  bool diagnostics = false;
};

/// Parse command line arguments:
///   --workspace=<dir> [--references=<ModuleRef>:<Kind>:<Method>]
///   [--include-declaration] [--diagnostics]
/// Returns nullopt when the arguments are invalid
auto ParseOptions(const std::vector<std::string>& args)
    -> std::optional<Options>;

/// Parse "<ModuleRef>:<Kind>:<Method>", e.g.
/// "CommonModule.Utils:CommonModule:DoWork"
auto ParseSymbolIdentity(std::string_view text)
    -> std::optional<bsld::semantic::SymbolIdentity>;

/// Setup named loggers for the bsld and index components
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app
