#include "bsld/services/document_analyzer.hpp"

#include <utility>

#include "bsld/syntax/call_site_collector.hpp"
#include "bsld/syntax/lexer.hpp"
#include "bsld/syntax/symbol_tree_builder.hpp"

namespace bsld::services {

DocumentAnalyzer::DocumentAnalyzer(
    std::shared_ptr<const semantic::ModuleRegistry> registry,
    std::shared_ptr<spdlog::logger> logger)
    : registry_(std::move(registry)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto DocumentAnalyzer::Analyze(
    std::string uri, semantic::ModuleId module, std::string content,
    int version) const -> AnalysisResult {
  auto tokens = syntax::Lexer(content).Tokenize();

  auto tree = syntax::SymbolTreeBuilder(module, logger_).Build(tokens);
  auto edges = syntax::CallSiteCollector(registry_, logger_).Collect(tokens);

  logger_->debug(
      "DocumentAnalyzer: {} as {} ({} symbols, {} call sites)", uri, module,
      tree.GetChildrenFlat().size(), edges.size());

  return AnalysisResult{
      .document = semantic::DocumentContext::Create(
          std::move(uri), std::move(module), version, std::move(content),
          std::move(tree)),
      .edges = std::move(edges)};
}

}  // namespace bsld::services
