#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "bsld/semantic/symbol_identity.hpp"
#include "bsld/semantic/symbol_tree.hpp"
#include "bsld/syntax/token.hpp"

namespace bsld::syntax {

// Builds the symbol tree of one module from its token stream: methods,
// #Region blocks and module variables
class SymbolTreeBuilder {
 public:
  explicit SymbolTreeBuilder(
      semantic::ModuleId module,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Build(const std::vector<Token>& tokens) -> semantic::SymbolTree;

 private:
  // Each returns the index of the first token it did not consume
  auto ParseMethod(
      const std::vector<Token>& tokens, std::size_t start,
      semantic::SymbolTree& tree) -> std::size_t;
  auto ParseVariables(
      const std::vector<Token>& tokens, std::size_t start,
      semantic::SymbolTree& tree) -> std::size_t;
  void HandlePreprocessor(const Token& token, semantic::SymbolTree& tree);

  [[nodiscard]] auto CurrentParent() const -> semantic::Symbol*;

  semantic::ModuleId module_;
  std::vector<semantic::Symbol*> regions_;
  std::vector<std::string> pending_directives_;
  lsp::Position document_end_{};
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bsld::syntax
