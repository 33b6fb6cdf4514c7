#pragma once

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "bsld/semantic/module_registry.hpp"
#include "bsld/semantic/reference_index.hpp"
#include "bsld/syntax/token.hpp"

namespace bsld::syntax {

// Finds qualified calls into other modules:
//   CommonModuleName.Method(
//   ManagerCollection.ObjectName.Method(
// Each edge's range is the range of the method name token.
class CallSiteCollector {
 public:
  explicit CallSiteCollector(
      std::shared_ptr<const semantic::ModuleRegistry> registry,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  [[nodiscard]] auto Collect(const std::vector<Token>& tokens) const
      -> std::vector<semantic::Edge>;

 private:
  std::shared_ptr<const semantic::ModuleRegistry> registry_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace bsld::syntax
