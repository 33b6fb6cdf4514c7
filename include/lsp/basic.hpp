#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lsp {

// URI
using Uri = std::string;
using DocumentUri = std::string;

// Position
struct Position {
  int line;
  int character;

  friend auto operator==(const Position& lhs, const Position& rhs)
      -> bool = default;
};

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

// Range
struct Range {
  Position start;
  Position end;

  friend auto operator==(const Range& lhs, const Range& rhs) -> bool = default;
};

void to_json(nlohmann::json& j, const Range& r);
void from_json(const nlohmann::json& j, Range& r);

// Location
struct Location {
  DocumentUri uri;
  Range range;

  friend auto operator==(const Location& lhs, const Location& rhs)
      -> bool = default;
};

void to_json(nlohmann::json& j, const Location& l);
void from_json(const nlohmann::json& j, Location& l);

// Diagnostic
enum class DiagnosticSeverity {
  Error = 1,
  Warning = 2,
  Information = 3,
  Hint = 4
};

void to_json(nlohmann::json& j, const DiagnosticSeverity& d);
void from_json(const nlohmann::json& j, DiagnosticSeverity& d);

enum class DiagnosticTag { Unnecessary = 1, Deprecated = 2 };

void to_json(nlohmann::json& j, const DiagnosticTag& d);
void from_json(const nlohmann::json& j, DiagnosticTag& d);

struct DiagnosticRelatedInformation {
  Location location;
  std::string message;
};

void to_json(nlohmann::json& j, const DiagnosticRelatedInformation& r);
void from_json(const nlohmann::json& j, DiagnosticRelatedInformation& r);

struct Diagnostic {
  Range range;
  std::optional<DiagnosticSeverity> severity;
  std::optional<std::string> code;
  std::optional<std::string> source;
  std::string message;
  std::optional<std::vector<DiagnosticTag>> tags;
  std::optional<std::vector<DiagnosticRelatedInformation>> relatedInformation;
};

void to_json(nlohmann::json& j, const Diagnostic& d);
void from_json(const nlohmann::json& j, Diagnostic& d);

// Symbol Kind
enum class SymbolKind {
  File = 1,
  Module = 2,
  Namespace = 3,
  Package = 4,
  Class = 5,
  Method = 6,
  Property = 7,
  Field = 8,
  Constructor = 9,
  Enum = 10,
  Interface = 11,
  Function = 12,
  Variable = 13,
  Constant = 14,
  String = 15,
  Number = 16,
  Boolean = 17,
  Array = 18,
  Object = 19,
  Key = 20,
  Null = 21,
  EnumMember = 22,
  Struct = 23,
  Event = 24,
  Operator = 25,
  TypeParameter = 26
};

void to_json(nlohmann::json& j, const SymbolKind& k);
void from_json(const nlohmann::json& j, SymbolKind& k);

enum class SymbolTag { Deprecated = 1 };

void to_json(nlohmann::json& j, const SymbolTag& t);
void from_json(const nlohmann::json& j, SymbolTag& t);

}  // namespace lsp
