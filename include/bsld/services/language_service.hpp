#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <asio.hpp>
#include <lsp/basic.hpp>
#include <lsp/error.hpp>
#include <lsp/hierarchy.hpp>
#include <spdlog/spdlog.h>

#include "bsld/core/bsld_config_file.hpp"
#include "bsld/core/workspace_layout.hpp"
#include "bsld/features/call_hierarchy_provider.hpp"
#include "bsld/features/definition_provider.hpp"
#include "bsld/features/privileged_module_call_diagnostic.hpp"
#include "bsld/features/references_provider.hpp"
#include "bsld/semantic/module_registry.hpp"
#include "bsld/semantic/reference_index.hpp"
#include "bsld/services/document_analyzer.hpp"
#include "bsld/services/open_document_tracker.hpp"
#include "bsld/utils/canonical_path.hpp"

namespace bsld::services {

using lsp::error::LspError;

// Owns the workspace model (registry and reference index) and keeps it
// current as documents are opened, edited and closed.
//
// Analysis runs on a thread pool. Results are committed on the service strand
// and only if no newer analysis of the same document was requested in the
// meantime.
class LanguageService {
 public:
  using DiagnosticPublisher = std::function<void(
      std::string uri, int version, std::vector<lsp::Diagnostic>)>;

  // `index_logger` receives the reference index's messages; defaults to
  // `logger`
  explicit LanguageService(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr,
      std::shared_ptr<spdlog::logger> index_logger = nullptr);

  LanguageService(const LanguageService&) = delete;
  LanguageService(LanguageService&&) = delete;
  auto operator=(const LanguageService&) -> LanguageService& = delete;
  auto operator=(LanguageService&&) -> LanguageService& = delete;
  ~LanguageService() = default;

  // Loads .bsld, registers every module of the workspace and analyzes all
  // sources. Completes when the index is built.
  auto InitializeWorkspace(std::string workspace_uri) -> asio::awaitable<void>;

  auto OnDocumentOpened(std::string uri, std::string content, int version)
      -> asio::awaitable<void>;

  auto OnDocumentChanged(std::string uri, std::string content, int version)
      -> asio::awaitable<void>;

  // Workspace files fall back to their content on disk; other documents are
  // dropped from the index
  auto OnDocumentClosed(std::string uri) -> asio::awaitable<void>;

  [[nodiscard]] auto IsDocumentOpen(const std::string& uri) const -> bool;

  auto SetDiagnosticPublisher(DiagnosticPublisher publisher) -> void {
    diagnostic_publisher_ = std::move(publisher);
  }

  auto ComputeDiagnostics(std::string uri) -> asio::awaitable<
      std::expected<std::vector<lsp::Diagnostic>, LspError>>;

  auto GetReferences(
      std::string uri, lsp::Position position, bool include_declaration)
      -> asio::awaitable<std::expected<std::vector<lsp::Location>, LspError>>;

  auto GetReferencesTo(
      semantic::SymbolIdentity target, bool include_declaration)
      -> asio::awaitable<std::expected<std::vector<lsp::Location>, LspError>>;

  auto GetDefinitionsForPosition(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<std::vector<lsp::Location>, LspError>>;

  auto PrepareCallHierarchy(std::string uri, lsp::Position position)
      -> asio::awaitable<
          std::expected<std::vector<lsp::CallHierarchyItem>, LspError>>;

  auto GetIncomingCalls(lsp::CallHierarchyItem item)
      -> asio::awaitable<std::expected<
          std::vector<lsp::CallHierarchyIncomingCall>, LspError>>;

  auto GetOutgoingCalls(lsp::CallHierarchyItem item)
      -> asio::awaitable<std::expected<
          std::vector<lsp::CallHierarchyOutgoingCall>, LspError>>;

  // URIs of every analyzed document, sorted
  [[nodiscard]] auto GetDocumentUris() const -> std::vector<std::string>;

  // Number of documents with an analysis still running
  auto GetPendingAnalysisCount() -> asio::awaitable<std::size_t>;

  [[nodiscard]] auto GetIndex() const
      -> std::shared_ptr<const semantic::ReferenceIndex> {
    return index_;
  }

 private:
  // Analyzes on the pool and commits on the strand. Reads the file from disk
  // when `content` is empty. Returns false when the result was discarded.
  auto AnalyzeAndCommit(
      std::string uri, std::optional<std::string> content, int version)
      -> asio::awaitable<bool>;

  auto PublishDiagnostics(const std::string& uri, int version) -> void;

  [[nodiscard]] auto ModuleForUri(const std::string& uri) const
      -> semantic::ModuleId;

  [[nodiscard]] auto CheckDocument(const std::string& uri) const
      -> std::expected<void, LspError>;

  void ApplyConfig(const BsldConfigFile& config);

  static auto GetThreadPoolSize() -> std::size_t {
    auto hw_threads = std::thread::hardware_concurrency();
    return std::max(std::size_t{1}, static_cast<std::size_t>(hw_threads) / 2);
  }

  std::shared_ptr<spdlog::logger> logger_;
  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;
  std::unique_ptr<asio::thread_pool> analysis_pool_;

  std::shared_ptr<semantic::ModuleRegistry> registry_;
  std::shared_ptr<semantic::ReferenceIndex> index_;
  DocumentAnalyzer analyzer_;

  features::ReferencesProvider references_;
  features::DefinitionProvider definitions_;
  features::CallHierarchyProvider call_hierarchy_;
  // Replaced when the configuration is loaded (strand only)
  std::shared_ptr<const features::PrivilegedModuleCallDiagnostic> diagnostic_;
  bool diagnostic_enabled_ = true;

  std::shared_ptr<OpenDocumentTracker> open_tracker_;

  // Strand only
  CanonicalPath workspace_root_;
  std::optional<WorkspaceLayout> layout_;
  // Analyses in flight per URI; an entry lives only while one is running
  struct PendingAnalysis {
    std::uint64_t generation = 0;
    int in_flight = 0;
  };
  std::unordered_map<std::string, PendingAnalysis> pending_analyses_;

  DiagnosticPublisher diagnostic_publisher_;
};

}  // namespace bsld::services
