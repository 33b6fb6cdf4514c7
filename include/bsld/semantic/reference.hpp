#pragma once

#include <memory>
#include <string>

#include <lsp/basic.hpp>

#include "bsld/semantic/symbol.hpp"

namespace bsld::semantic {

// A resolved call site. `from` is the symbol enclosing the site, `symbol` is
// the called method. Both keep their documents alive.
struct Reference {
  std::shared_ptr<const Symbol> from;
  std::shared_ptr<const Symbol> symbol;
  std::string uri;
  lsp::Range selection_range;

  [[nodiscard]] auto ToLocation() const -> lsp::Location {
    return lsp::Location{.uri = uri, .range = selection_range};
  }
};

}  // namespace bsld::semantic
