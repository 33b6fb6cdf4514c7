#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "bsld/semantic/document_context.hpp"
#include "bsld/semantic/module_registry.hpp"
#include "bsld/semantic/reference_index.hpp"

namespace bsld::services {

struct AnalysisResult {
  std::shared_ptr<const semantic::DocumentContext> document;
  std::vector<semantic::Edge> edges;
};

// Lexes one document, builds its symbol tree and collects its outgoing call
// edges. Reads the registry only to recognize common module names; commits
// nothing, so it is safe to run on any thread.
class DocumentAnalyzer {
 public:
  explicit DocumentAnalyzer(
      std::shared_ptr<const semantic::ModuleRegistry> registry,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto Analyze(
      std::string uri, semantic::ModuleId module, std::string content,
      int version) const -> AnalysisResult;

 private:
  std::shared_ptr<const semantic::ModuleRegistry> registry_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bsld::services
