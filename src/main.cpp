#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <asio.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "bsld/services/language_service.hpp"
#include "bsld/utils/exception_utils.hpp"
#include "bsld/utils/path_utils.hpp"

using bsld::services::LanguageService;

auto main(int argc, char* argv[]) -> int {
  // Parse command-line arguments
  const std::vector<std::string> args(argv, argv + argc);
  auto options_opt = app::ParseOptions(args);
  if (!options_opt) {
    fmt::print(
        stderr,
        "Usage: bsld --workspace=<dir> "
        "[--references=<ModuleRef>:<Kind>:<Method>] "
        "[--include-declaration] [--diagnostics]\n");
    return 1;
  }
  const app::Options options = std::move(*options_opt);

  auto loggers = app::SetupLoggers();

  asio::io_context io_context;
  auto executor = io_context.get_executor();

  auto language_service = std::make_shared<LanguageService>(
      executor, loggers["bsld"], loggers["index"]);

  int exit_code = 0;
  asio::co_spawn(
      io_context,
      [&]() -> asio::awaitable<void> {
        const auto workspace_uri = bsld::PathToUri(
            bsld::NormalizePath(std::filesystem::path(options.workspace)));
        co_await language_service->InitializeWorkspace(workspace_uri);

        nlohmann::json output;
        output["workspace"] = workspace_uri;
        output["documents"] = language_service->GetDocumentUris().size();
        output["edges"] = language_service->GetIndex()->GetEdgeCount();

        if (options.references) {
          auto result = co_await language_service->GetReferencesTo(
              *options.references, options.include_declaration);
          if (!result) {
            spdlog::error("References failed: {}", result.error().Message());
            exit_code = 1;
            co_return;
          }
          output["references"] = *result;
        }

        if (options.diagnostics) {
          auto diagnostics = nlohmann::json::object();
          for (const auto& uri : language_service->GetDocumentUris()) {
            auto result = co_await language_service->ComputeDiagnostics(uri);
            if (!result) {
              spdlog::error(
                  "Diagnostics failed for {}: {}", uri,
                  result.error().Message());
              exit_code = 1;
              continue;
            }
            if (!result->empty()) {
              diagnostics[uri] = *result;
            }
          }
          output["diagnostics"] = std::move(diagnostics);
        }

        fmt::print("{}\n", output.dump(2));
      },
      [&exit_code](const std::exception_ptr& error) {
        if (error) {
          spdlog::error(
              "bsld failed: {}", bsld::utils::DescribeException(error));
          exit_code = 1;
        }
      });

  try {
    io_context.run();
  } catch (const std::exception& e) {
    spdlog::error("bsld failed: {}", e.what());
    return 1;
  }
  return exit_code;
}
