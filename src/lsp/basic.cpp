#include "lsp/basic.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

// Position
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("line").get_to(p.line);
  j.at("character").get_to(p.character);
}

// Range
void to_json(nlohmann::json& j, const Range& r) {
  j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, Range& r) {
  j.at("start").get_to(r.start);
  j.at("end").get_to(r.end);
}

// Location
void to_json(nlohmann::json& j, const Location& l) {
  j = nlohmann::json{{"uri", l.uri}, {"range", l.range}};
}

void from_json(const nlohmann::json& j, Location& l) {
  j.at("uri").get_to(l.uri);
  j.at("range").get_to(l.range);
}

// Diagnostic
void to_json(nlohmann::json& j, const DiagnosticSeverity& d) {
  j = static_cast<int>(d);
}

void from_json(const nlohmann::json& j, DiagnosticSeverity& d) {
  auto value = j.get<int>();
  if (value < static_cast<int>(DiagnosticSeverity::Error) ||
      value > static_cast<int>(DiagnosticSeverity::Hint)) {
    throw std::runtime_error("Invalid diagnostic severity");
  }
  d = static_cast<DiagnosticSeverity>(value);
}

void to_json(nlohmann::json& j, const DiagnosticTag& d) {
  j = static_cast<int>(d);
}

void from_json(const nlohmann::json& j, DiagnosticTag& d) {
  d = static_cast<DiagnosticTag>(j.get<int>());
}

void to_json(nlohmann::json& j, const DiagnosticRelatedInformation& r) {
  j = nlohmann::json{{"location", r.location}, {"message", r.message}};
}

void from_json(const nlohmann::json& j, DiagnosticRelatedInformation& r) {
  j.at("location").get_to(r.location);
  j.at("message").get_to(r.message);
}

void to_json(nlohmann::json& j, const Diagnostic& d) {
  j = nlohmann::json{};
  j["range"] = d.range;
  to_json_optional(j, "severity", d.severity);
  to_json_optional(j, "code", d.code);
  to_json_optional(j, "source", d.source);
  j["message"] = d.message;
  to_json_optional(j, "tags", d.tags);
  to_json_optional(j, "relatedInformation", d.relatedInformation);
}

void from_json(const nlohmann::json& j, Diagnostic& d) {
  j.at("range").get_to(d.range);
  from_json_optional(j, "severity", d.severity);
  from_json_optional(j, "code", d.code);
  from_json_optional(j, "source", d.source);
  j.at("message").get_to(d.message);
  from_json_optional(j, "tags", d.tags);
  from_json_optional(j, "relatedInformation", d.relatedInformation);
}

// Symbol Kind
void to_json(nlohmann::json& j, const SymbolKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, SymbolKind& k) {
  auto value = j.get<int>();
  if (value < static_cast<int>(SymbolKind::File) ||
      value > static_cast<int>(SymbolKind::TypeParameter)) {
    throw std::runtime_error("Invalid symbol kind");
  }
  k = static_cast<SymbolKind>(value);
}

// Symbol Tag
void to_json(nlohmann::json& j, const SymbolTag& t) {
  j = static_cast<int>(t);
}

void from_json(const nlohmann::json& j, SymbolTag& t) {
  t = static_cast<SymbolTag>(j.get<int>());
}

}  // namespace lsp
