#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "bsld/semantic/module_registry.hpp"
#include "bsld/semantic/reference_index.hpp"
#include "bsld/services/document_analyzer.hpp"

namespace bsld::test {

// In-memory workspace: documents are analyzed and committed the same way the
// language service does it, without disk or executors
class IndexFixture {
 public:
  IndexFixture()
      : registry_(std::make_shared<semantic::ModuleRegistry>()),
        index_(std::make_shared<semantic::ReferenceIndex>(registry_)),
        analyzer_(registry_) {
  }

  // Makes the module known (and, for common modules, callable by short name)
  // without loading a document
  void Register(const std::string& uri, const semantic::ModuleId& module) {
    registry_->RegisterModule(module, uri);
  }

  // Loads the document without committing its call edges
  auto Load(
      const std::string& uri, const semantic::ModuleId& module,
      std::string content, int version = 0) -> std::vector<semantic::Edge> {
    registry_->RegisterModule(module, uri);
    auto result = analyzer_.Analyze(uri, module, std::move(content), version);
    registry_->Load(result.document);
    return std::move(result.edges);
  }

  // Loads the document and commits its call edges
  void Index(
      const std::string& uri, const semantic::ModuleId& module,
      std::string content, int version = 0) {
    auto edges = Load(uri, module, std::move(content), version);
    index_->ReplaceDocumentEdges(uri, std::move(edges));
  }

  [[nodiscard]] auto Registry() const
      -> const std::shared_ptr<semantic::ModuleRegistry>& {
    return registry_;
  }

  [[nodiscard]] auto GetIndex() const
      -> const std::shared_ptr<semantic::ReferenceIndex>& {
    return index_;
  }

 private:
  std::shared_ptr<semantic::ModuleRegistry> registry_;
  std::shared_ptr<semantic::ReferenceIndex> index_;
  services::DocumentAnalyzer analyzer_;
};

inline auto CommonModule(std::string name) -> semantic::ModuleId {
  return semantic::ModuleId{
      .mdo_ref = "CommonModule." + name,
      .kind = semantic::ModuleKind::kCommonModule};
}

}  // namespace bsld::test
