#include "bsld/services/language_service.hpp"

#include <exception>
#include <fstream>
#include <sstream>
#include <utility>

#include <asio/deferred.hpp>
#include <asio/experimental/parallel_group.hpp>
#include <nlohmann/json.hpp>

#include "bsld/core/config_reader.hpp"
#include "bsld/core/discovery_provider.hpp"
#include "bsld/utils/exception_utils.hpp"
#include "bsld/utils/path_utils.hpp"
#include "bsld/utils/stage_timer.hpp"

namespace bsld::services {

namespace {

auto ReadDocumentFromDisk(const std::string& uri) -> std::optional<std::string> {
  std::ifstream file(UriToPath(uri), std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

}  // namespace

LanguageService::LanguageService(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger,
    std::shared_ptr<spdlog::logger> index_logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      strand_(asio::make_strand(executor)),
      analysis_pool_(std::make_unique<asio::thread_pool>(GetThreadPoolSize())),
      registry_(std::make_shared<semantic::ModuleRegistry>(logger_)),
      index_(std::make_shared<semantic::ReferenceIndex>(
          registry_, index_logger ? index_logger : logger_)),
      analyzer_(registry_, logger_),
      references_(registry_, index_, logger_),
      definitions_(registry_, index_, logger_),
      call_hierarchy_(registry_, index_, logger_),
      diagnostic_(std::make_shared<features::PrivilegedModuleCallDiagnostic>(
          index_, std::vector<std::string>{}, logger_)),
      open_tracker_(std::make_shared<OpenDocumentTracker>()) {
  logger_->debug(
      "LanguageService created with {} analysis threads", GetThreadPoolSize());
}

auto LanguageService::InitializeWorkspace(std::string workspace_uri)
    -> asio::awaitable<void> {
  utils::StageTimer timer("Workspace indexing", logger_);
  co_await asio::post(strand_, asio::use_awaitable);

  workspace_root_ = CanonicalPath::FromUri(workspace_uri);
  logger_->info("LanguageService initializing workspace: {}", workspace_root_);

  auto config = ConfigReader(logger_).LoadOrDefault(workspace_root_);
  ApplyConfig(config);
  layout_.emplace(workspace_root_, config);

  auto files = DiscoveryProvider(logger_).DiscoverFiles(workspace_root_, config);
  for (const auto& file : files) {
    registry_->RegisterModule(layout_->ModuleFor(file), file.ToUri());
  }
  logger_->info(
      "LanguageService registered {} modules", registry_->GetModuleCount());
  timer.Mark("discovery");

  using Operation = decltype(asio::co_spawn(
      strand_, std::declval<asio::awaitable<bool>>(), asio::deferred));
  std::vector<Operation> operations;
  operations.reserve(files.size());
  for (const auto& file : files) {
    operations.push_back(asio::co_spawn(
        strand_, AnalyzeAndCommit(file.ToUri(), std::nullopt, 0),
        asio::deferred));
  }

  if (!operations.empty()) {
    [[maybe_unused]] auto [order, errors, committed] =
        co_await asio::experimental::make_parallel_group(std::move(operations))
            .async_wait(
                asio::experimental::wait_for_all(), asio::use_awaitable);

    for (std::size_t i = 0; i < errors.size(); ++i) {
      if (errors[i]) {
        logger_->error(
            "LanguageService failed to analyze {}: {}", files[i],
            utils::DescribeException(errors[i]));
      }
    }
  }

  timer.Mark("analysis");

  logger_->info(
      "LanguageService indexed {} documents ({} call edges)",
      index_->GetDocumentCount(), index_->GetEdgeCount());
}

auto LanguageService::OnDocumentOpened(
    std::string uri, std::string content, int version)
    -> asio::awaitable<void> {
  uri = NormalizeUri(uri);
  logger_->debug("LanguageService document opened: {} (v{})", uri, version);
  open_tracker_->Add(uri, version);

  if (co_await AnalyzeAndCommit(uri, std::move(content), version)) {
    PublishDiagnostics(uri, version);
  }
}

auto LanguageService::OnDocumentChanged(
    std::string uri, std::string content, int version)
    -> asio::awaitable<void> {
  uri = NormalizeUri(uri);
  open_tracker_->Update(uri, version);

  if (co_await AnalyzeAndCommit(uri, std::move(content), version)) {
    PublishDiagnostics(uri, version);
  }
}

auto LanguageService::OnDocumentClosed(std::string uri)
    -> asio::awaitable<void> {
  uri = NormalizeUri(uri);
  logger_->debug("LanguageService document closed: {}", uri);
  open_tracker_->Remove(uri);

  co_await asio::post(strand_, asio::use_awaitable);

  auto path = CanonicalPath::FromUri(uri);
  bool in_workspace = !workspace_root_.Empty() &&
                      path.IsSubPathOf(workspace_root_) && IsBslFile(path.Path()) &&
                      std::filesystem::exists(path.Path());

  if (in_workspace) {
    // The editor buffer may have been discarded without saving
    co_await AnalyzeAndCommit(uri, std::nullopt, 0);
  } else {
    // Invalidates any analysis still in flight
    if (auto pending = pending_analyses_.find(uri);
        pending != pending_analyses_.end()) {
      ++pending->second.generation;
    }
    registry_->Unload(uri);
    index_->RetractDocument(uri);
  }

  if (diagnostic_publisher_) {
    asio::post(executor_, [publisher = diagnostic_publisher_, uri]() {
      publisher(uri, 0, {});
    });
  }
}

auto LanguageService::IsDocumentOpen(const std::string& uri) const -> bool {
  return open_tracker_->Contains(NormalizeUri(uri));
}

auto LanguageService::ComputeDiagnostics(std::string uri) -> asio::awaitable<
    std::expected<std::vector<lsp::Diagnostic>, LspError>> {
  co_await asio::post(strand_, asio::use_awaitable);
  uri = NormalizeUri(uri);

  if (auto check = CheckDocument(uri); !check) {
    co_return std::unexpected(check.error());
  }
  if (!diagnostic_enabled_) {
    co_return std::vector<lsp::Diagnostic>{};
  }
  co_return diagnostic_->Compute(uri);
}

auto LanguageService::GetReferences(
    std::string uri, lsp::Position position, bool include_declaration)
    -> asio::awaitable<std::expected<std::vector<lsp::Location>, LspError>> {
  co_await asio::post(strand_, asio::use_awaitable);
  uri = NormalizeUri(uri);

  if (auto check = CheckDocument(uri); !check) {
    co_return std::unexpected(check.error());
  }
  co_return references_.GetReferences(uri, position, include_declaration);
}

auto LanguageService::GetReferencesTo(
    semantic::SymbolIdentity target, bool include_declaration)
    -> asio::awaitable<std::expected<std::vector<lsp::Location>, LspError>> {
  co_await asio::post(strand_, asio::use_awaitable);

  if (!registry_->GetModuleUri(target.Module())) {
    co_return LspError::UnexpectedFromCode(
        lsp::error::LspErrorCode::kInvalidParams,
        fmt::format("Unknown module {}", target.Module()));
  }
  co_return references_.GetReferencesTo(target, include_declaration);
}

auto LanguageService::GetDefinitionsForPosition(
    std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<std::vector<lsp::Location>, LspError>> {
  co_await asio::post(strand_, asio::use_awaitable);
  uri = NormalizeUri(uri);

  if (auto check = CheckDocument(uri); !check) {
    co_return std::unexpected(check.error());
  }
  co_return definitions_.GetDefinitionForUri(uri, position);
}

auto LanguageService::PrepareCallHierarchy(
    std::string uri, lsp::Position position)
    -> asio::awaitable<
        std::expected<std::vector<lsp::CallHierarchyItem>, LspError>> {
  co_await asio::post(strand_, asio::use_awaitable);
  uri = NormalizeUri(uri);

  if (auto check = CheckDocument(uri); !check) {
    co_return std::unexpected(check.error());
  }
  co_return call_hierarchy_.PrepareCallHierarchy(uri, position);
}

auto LanguageService::GetIncomingCalls(lsp::CallHierarchyItem item)
    -> asio::awaitable<std::expected<
        std::vector<lsp::CallHierarchyIncomingCall>, LspError>> {
  co_await asio::post(strand_, asio::use_awaitable);
  try {
    co_return call_hierarchy_.GetIncomingCalls(item);
  } catch (const std::runtime_error& e) {
    co_return LspError::UnexpectedFromCode(
        lsp::error::LspErrorCode::kInvalidParams, e.what());
  } catch (const nlohmann::json::exception& e) {
    co_return LspError::UnexpectedFromCode(
        lsp::error::LspErrorCode::kInvalidParams, e.what());
  }
}

auto LanguageService::GetOutgoingCalls(lsp::CallHierarchyItem item)
    -> asio::awaitable<std::expected<
        std::vector<lsp::CallHierarchyOutgoingCall>, LspError>> {
  co_await asio::post(strand_, asio::use_awaitable);
  try {
    co_return call_hierarchy_.GetOutgoingCalls(item);
  } catch (const std::runtime_error& e) {
    co_return LspError::UnexpectedFromCode(
        lsp::error::LspErrorCode::kInvalidParams, e.what());
  } catch (const nlohmann::json::exception& e) {
    co_return LspError::UnexpectedFromCode(
        lsp::error::LspErrorCode::kInvalidParams, e.what());
  }
}

auto LanguageService::GetPendingAnalysisCount()
    -> asio::awaitable<std::size_t> {
  co_await asio::post(strand_, asio::use_awaitable);
  co_return pending_analyses_.size();
}

auto LanguageService::GetDocumentUris() const -> std::vector<std::string> {
  std::vector<std::string> uris;
  for (const auto& document : registry_->GetLoadedDocuments()) {
    uris.push_back(document->Uri());
  }
  std::ranges::sort(uris);
  return uris;
}

auto LanguageService::AnalyzeAndCommit(
    std::string uri, std::optional<std::string> content, int version)
    -> asio::awaitable<bool> {
  co_await asio::post(strand_, asio::use_awaitable);
  auto& pending = pending_analyses_[uri];
  auto generation = ++pending.generation;
  ++pending.in_flight;
  auto module = ModuleForUri(uri);

  auto result = co_await asio::co_spawn(
      analysis_pool_->get_executor(),
      [this, uri, module, content = std::move(content),
       version]() mutable -> asio::awaitable<std::optional<AnalysisResult>> {
        if (!content) {
          content = ReadDocumentFromDisk(uri);
          if (!content) {
            logger_->warn("LanguageService cannot read {}", uri);
            co_return std::nullopt;
          }
        }
        try {
          co_return analyzer_.Analyze(
              uri, module, std::move(*content), version);
        } catch (const std::exception& e) {
          logger_->error(
              "LanguageService failed to analyze {}: {}", uri, e.what());
          co_return std::nullopt;
        }
      },
      asio::use_awaitable);

  co_await asio::post(strand_, asio::use_awaitable);

  auto pending_it = pending_analyses_.find(uri);
  bool superseded = pending_it->second.generation != generation;
  if (--pending_it->second.in_flight == 0) {
    pending_analyses_.erase(pending_it);
  }
  if (superseded) {
    logger_->debug(
        "LanguageService discarding stale analysis of {} (v{})", uri, version);
    co_return false;
  }
  if (!result) {
    co_return false;
  }

  registry_->Load(result->document);
  index_->ReplaceDocumentEdges(uri, std::move(result->edges));
  co_return true;
}

auto LanguageService::PublishDiagnostics(const std::string& uri, int version)
    -> void {
  if (!diagnostic_publisher_) {
    return;
  }
  auto diagnostics = diagnostic_enabled_ ? diagnostic_->Compute(uri)
                                         : std::vector<lsp::Diagnostic>{};
  asio::post(
      executor_, [publisher = diagnostic_publisher_, uri, version,
                  diagnostics = std::move(diagnostics)]() {
        publisher(uri, version, diagnostics);
      });
}

auto LanguageService::ModuleForUri(const std::string& uri) const
    -> semantic::ModuleId {
  if (auto registered = registry_->GetModuleForUri(uri)) {
    return *registered;
  }
  auto path = CanonicalPath::FromUri(uri);
  if (layout_) {
    return layout_->ModuleFor(path);
  }
  return WorkspaceLayout::FromDesignerPath(path.Path().generic_string());
}

auto LanguageService::CheckDocument(const std::string& uri) const
    -> std::expected<void, LspError> {
  if (!registry_->GetDocument(uri)) {
    logger_->debug("LanguageService: document not found: {}", uri);
    return LspError::UnexpectedFromCode(
        lsp::error::LspErrorCode::kDocumentNotFound, uri);
  }
  return lsp::error::Ok();
}

void LanguageService::ApplyConfig(const BsldConfigFile& config) {
  diagnostic_ = std::make_shared<features::PrivilegedModuleCallDiagnostic>(
      index_, config.GetPrivilegedModules(), logger_);
  diagnostic_enabled_ = config.IsPrivilegedModuleCallCheckEnabled();
  logger_->debug(
      "LanguageService: {} privileged modules, check {}",
      config.GetPrivilegedModules().size(),
      diagnostic_enabled_ ? "enabled" : "disabled");
}

}  // namespace bsld::services
