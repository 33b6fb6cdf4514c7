#include "bsld/syntax/call_site_collector.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>

#include "bsld/semantic/metadata_types.hpp"
#include "bsld/syntax/lexer.hpp"

namespace bsld::syntax {

namespace {

auto IsIdentifierAt(const std::vector<Token>& tokens, std::size_t i) -> bool {
  return i < tokens.size() && tokens[i].Is(TokenKind::kIdentifier);
}

auto IsPunctuationAt(const std::vector<Token>& tokens, std::size_t i, char c)
    -> bool {
  return i < tokens.size() && tokens[i].IsPunctuation(c);
}

}  // namespace

CallSiteCollector::CallSiteCollector(
    std::shared_ptr<const semantic::ModuleRegistry> registry,
    std::shared_ptr<spdlog::logger> logger)
    : registry_(std::move(registry)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto CallSiteCollector::Collect(const std::vector<Token>& tokens) const
    -> std::vector<semantic::Edge> {
  auto code = Lexer::Significant(tokens);
  std::vector<semantic::Edge> edges;

  for (std::size_t i = 0; i < code.size(); ++i) {
    if (!code[i].Is(TokenKind::kIdentifier)) {
      continue;
    }
    // x.CommonUtils.DoWork( is a member access on a value
    if (i > 0 && code[i - 1].IsPunctuation('.')) {
      continue;
    }
    if (!IsPunctuationAt(code, i + 1, '.') || !IsIdentifierAt(code, i + 2)) {
      continue;
    }

    if (const auto* collection = semantic::FindManagerCollection(code[i].text);
        collection != nullptr) {
      if (IsPunctuationAt(code, i + 3, '.') && IsIdentifierAt(code, i + 4) &&
          IsPunctuationAt(code, i + 5, '(')) {
        auto mdo_ref = fmt::format("{}.{}", collection->type, code[i + 2].text);
        // Object names are case-insensitive; index under the registered one
        if (auto module = registry_->FindModule(
                mdo_ref, semantic::ModuleKind::kManagerModule)) {
          mdo_ref = module->mdo_ref;
        }
        edges.push_back(semantic::Edge{
            .target = semantic::SymbolIdentity(
                std::move(mdo_ref), semantic::ModuleKind::kManagerModule,
                code[i + 4].text),
            .range = code[i + 4].range});
      }
      continue;
    }

    if (!IsPunctuationAt(code, i + 3, '(')) {
      continue;
    }
    auto module = registry_->FindCommonModule(code[i].text);
    if (!module) {
      continue;
    }
    edges.push_back(semantic::Edge{
        .target = semantic::SymbolIdentity(*module, code[i + 2].text),
        .range = code[i + 2].range});
  }

  logger_->debug("CallSiteCollector found {} call sites", edges.size());
  return edges;
}

}  // namespace bsld::syntax
