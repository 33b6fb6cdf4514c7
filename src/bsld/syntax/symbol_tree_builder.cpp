#include "bsld/syntax/symbol_tree_builder.hpp"

#include <utility>

#include "bsld/syntax/keywords.hpp"
#include "bsld/syntax/lexer.hpp"

namespace bsld::syntax {

using semantic::Symbol;
using semantic::SymbolTree;

namespace {

auto TrimLeft(std::string_view text) -> std::string_view {
  auto first = text.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  return text.substr(first);
}

auto TrimRight(std::string_view text) -> std::string_view {
  auto last = text.find_last_not_of(" \t\r");
  if (last == std::string_view::npos) {
    return {};
  }
  return text.substr(0, last + 1);
}

}  // namespace

SymbolTreeBuilder::SymbolTreeBuilder(
    semantic::ModuleId module, std::shared_ptr<spdlog::logger> logger)
    : module_(std::move(module)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto SymbolTreeBuilder::Build(const std::vector<Token>& tokens) -> SymbolTree {
  regions_.clear();
  pending_directives_.clear();

  auto significant = Lexer::Significant(tokens);
  document_end_ = significant.empty() ? lsp::Position{.line = 0, .character = 0}
                                      : significant.back().range.end;

  SymbolTree tree(Symbol{
      .name = module_.mdo_ref,
      .kind = lsp::SymbolKind::Module,
      .range = {.start = {.line = 0, .character = 0}, .end = document_end_},
      .selection_range =
          {.start = {.line = 0, .character = 0},
           .end = {.line = 0, .character = 0}},
      .owner = module_});

  std::size_t i = 0;
  while (i < significant.size()) {
    const auto& token = significant[i];
    if (token.Is(TokenKind::kEndOfFile)) {
      break;
    }
    if (token.Is(TokenKind::kPreprocessor)) {
      HandlePreprocessor(token, tree);
      ++i;
      continue;
    }
    if (token.Is(TokenKind::kAnnotation)) {
      pending_directives_.push_back(token.text);
      ++i;
      continue;
    }

    bool member_access = i > 0 && significant[i - 1].IsPunctuation('.');
    if (!member_access &&
        (IsKeyword(token, kProcedure) || IsKeyword(token, kFunction))) {
      i = ParseMethod(significant, i, tree);
      continue;
    }
    if (!member_access && IsKeyword(token, kVar)) {
      i = ParseVariables(significant, i, tree);
      continue;
    }

    pending_directives_.clear();
    ++i;
  }

  for (auto* region : regions_) {
    logger_->debug(
        "SymbolTreeBuilder: region '{}' in {} is not closed", region->name,
        module_);
    region->range.end = document_end_;
  }
  regions_.clear();

  return tree;
}

auto SymbolTreeBuilder::ParseMethod(
    const std::vector<Token>& tokens, std::size_t start, SymbolTree& tree)
    -> std::size_t {
  const auto& keyword = tokens[start];
  bool is_function = IsKeyword(keyword, kFunction);
  const auto& end_keyword = is_function ? kEndFunction : kEndProcedure;

  std::size_t i = start + 1;
  if (i >= tokens.size() || !tokens[i].Is(TokenKind::kIdentifier)) {
    logger_->debug(
        "SymbolTreeBuilder: '{}' without a name at {}:{}", keyword.text,
        keyword.range.start.line, keyword.range.start.character);
    pending_directives_.clear();
    return start + 1;
  }
  const auto& name_token = tokens[i++];

  std::vector<std::string> parameters;
  if (i < tokens.size() && tokens[i].IsPunctuation('(')) {
    ++i;
    bool expect_name = true;
    while (i < tokens.size() && !tokens[i].IsPunctuation(')') &&
           !tokens[i].Is(TokenKind::kEndOfFile)) {
      const auto& token = tokens[i];
      if (token.IsPunctuation(',')) {
        expect_name = true;
      } else if (
          expect_name && token.Is(TokenKind::kIdentifier) &&
          !IsKeyword(token, kVal)) {
        parameters.push_back(token.text);
        expect_name = false;
      }
      ++i;
    }
    if (i < tokens.size() && tokens[i].IsPunctuation(')')) {
      ++i;
    }
  }

  bool is_export = false;
  if (i < tokens.size() && IsKeyword(tokens[i], kExport)) {
    is_export = true;
    ++i;
  }

  auto end = document_end_;
  bool terminated = false;
  while (i < tokens.size() && !tokens[i].Is(TokenKind::kEndOfFile)) {
    if (IsKeyword(tokens[i], end_keyword)) {
      end = tokens[i].range.end;
      terminated = true;
      ++i;
      break;
    }
    ++i;
  }
  if (!terminated) {
    logger_->debug(
        "SymbolTreeBuilder: method '{}' in {} is not terminated",
        name_token.text, module_);
  }

  tree.AddSymbol(
      Symbol{
          .name = name_token.text,
          .kind = lsp::SymbolKind::Method,
          .range = {.start = keyword.range.start, .end = end},
          .selection_range = name_token.range,
          .owner = module_,
          .is_export = is_export,
          .is_function = is_function,
          .parameters = std::move(parameters),
          .directives = std::move(pending_directives_)},
      CurrentParent());
  pending_directives_.clear();
  return i;
}

auto SymbolTreeBuilder::ParseVariables(
    const std::vector<Token>& tokens, std::size_t start, SymbolTree& tree)
    -> std::size_t {
  std::size_t i = start + 1;
  while (i < tokens.size() && !tokens[i].Is(TokenKind::kEndOfFile)) {
    const auto& token = tokens[i];
    if (token.IsPunctuation(';')) {
      ++i;
      break;
    }
    if (token.Is(TokenKind::kIdentifier) && !IsKeyword(token, kExport)) {
      bool exported = i + 1 < tokens.size() && IsKeyword(tokens[i + 1], kExport);
      tree.AddSymbol(
          Symbol{
              .name = token.text,
              .kind = lsp::SymbolKind::Variable,
              .range = token.range,
              .selection_range = token.range,
              .owner = module_,
              .is_export = exported,
              .directives = pending_directives_},
          CurrentParent());
    }
    ++i;
  }
  pending_directives_.clear();
  return i;
}

void SymbolTreeBuilder::HandlePreprocessor(
    const Token& token, SymbolTree& tree) {
  auto body = TrimLeft(std::string_view(token.text).substr(1));
  auto word_end = body.find_first_of(" \t");
  auto word = body.substr(0, word_end);

  if (Matches(word, kRegion)) {
    auto name = word_end == std::string_view::npos
                    ? std::string_view{}
                    : TrimRight(TrimLeft(body.substr(word_end)));
    auto* region = tree.AddSymbol(
        Symbol{
            .name = std::string(name),
            .kind = lsp::SymbolKind::Namespace,
            .range = {.start = token.range.start, .end = document_end_},
            .selection_range = token.range,
            .owner = module_},
        CurrentParent());
    regions_.push_back(region);
    return;
  }

  if (Matches(word, kEndRegion)) {
    if (regions_.empty()) {
      logger_->debug(
          "SymbolTreeBuilder: unmatched #EndRegion at {}:{} in {}",
          token.range.start.line, token.range.start.character, module_);
      return;
    }
    regions_.back()->range.end = token.range.end;
    regions_.pop_back();
  }
}

auto SymbolTreeBuilder::CurrentParent() const -> Symbol* {
  return regions_.empty() ? nullptr : regions_.back();
}

}  // namespace bsld::syntax
