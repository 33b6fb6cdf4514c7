#include "lsp/hierarchy.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// Call Hierarchy Item
void to_json(nlohmann::json& j, const CallHierarchyItem& i) {
  j = nlohmann::json{
      {"name", i.name},
      {"kind", i.kind},
      {"uri", i.uri},
      {"range", i.range},
      {"selectionRange", i.selectionRange}};
  to_json_optional(j, "tags", i.tags);
  to_json_optional(j, "detail", i.detail);
  to_json_optional(j, "data", i.data);
}

void from_json(const nlohmann::json& j, CallHierarchyItem& i) {
  j.at("name").get_to(i.name);
  j.at("kind").get_to(i.kind);
  j.at("uri").get_to(i.uri);
  j.at("range").get_to(i.range);
  j.at("selectionRange").get_to(i.selectionRange);
  from_json_optional(j, "tags", i.tags);
  from_json_optional(j, "detail", i.detail);
  from_json_optional(j, "data", i.data);
}

// Call Hierarchy Incoming Calls
void to_json(nlohmann::json& j, const CallHierarchyIncomingCall& c) {
  j = nlohmann::json{{"from", c.from}, {"fromRanges", c.fromRanges}};
}

void from_json(const nlohmann::json& j, CallHierarchyIncomingCall& c) {
  j.at("from").get_to(c.from);
  j.at("fromRanges").get_to(c.fromRanges);
}

// Call Hierarchy Outgoing Calls
void to_json(nlohmann::json& j, const CallHierarchyOutgoingCall& c) {
  j = nlohmann::json{{"to", c.to}, {"fromRanges", c.fromRanges}};
}

void from_json(const nlohmann::json& j, CallHierarchyOutgoingCall& c) {
  j.at("to").get_to(c.to);
  j.at("fromRanges").get_to(c.fromRanges);
}

}  // namespace lsp
