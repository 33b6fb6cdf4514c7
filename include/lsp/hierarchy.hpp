#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

struct CallHierarchyItem {
  std::string name;
  SymbolKind kind;
  std::optional<std::vector<SymbolTag>> tags;
  std::optional<std::string> detail;
  DocumentUri uri;
  Range range;
  Range selectionRange;
  std::optional<nlohmann::json> data;
};

void to_json(nlohmann::json& j, const CallHierarchyItem& i);
void from_json(const nlohmann::json& j, CallHierarchyItem& i);

// Call Hierarchy Incoming Calls
struct CallHierarchyIncomingCall {
  CallHierarchyItem from;
  std::vector<Range> fromRanges;
};

void to_json(nlohmann::json& j, const CallHierarchyIncomingCall& c);
void from_json(const nlohmann::json& j, CallHierarchyIncomingCall& c);

// Call Hierarchy Outgoing Calls
struct CallHierarchyOutgoingCall {
  CallHierarchyItem to;
  std::vector<Range> fromRanges;
};

void to_json(nlohmann::json& j, const CallHierarchyOutgoingCall& c);
void from_json(const nlohmann::json& j, CallHierarchyOutgoingCall& c);

}  // namespace lsp
