#pragma once

#include <memory>
#include <optional>
#include <string>

#include <lsp/basic.hpp>
#include <spdlog/spdlog.h>

#include "bsld/semantic/module_registry.hpp"
#include "bsld/semantic/reference_index.hpp"
#include "bsld/semantic/symbol.hpp"

namespace bsld::features {

// Shared state of the features answering queries over the reference index
class LanguageFeatureProvider {
 public:
  LanguageFeatureProvider(
      std::shared_ptr<const semantic::ModuleRegistry> registry,
      std::shared_ptr<const semantic::ReferenceIndex> index,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      : registry_(std::move(registry)),
        index_(std::move(index)),
        logger_(logger ? logger : spdlog::default_logger()) {
  }

 protected:
  // Method under the cursor: the callee when on a call site, the declared
  // method when on a declaration name
  [[nodiscard]] auto FindMethodAt(
      const std::string& uri, const lsp::Position& position) const
      -> std::shared_ptr<const semantic::Symbol>;

  // Location of a symbol's name in its module's document
  [[nodiscard]] auto DeclarationOf(const semantic::Symbol& symbol) const
      -> std::optional<lsp::Location>;

  std::shared_ptr<const semantic::ModuleRegistry> registry_;
  std::shared_ptr<const semantic::ReferenceIndex> index_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bsld::features
