#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lsp {

// Optional members are omitted from the output instead of written as null
template <typename T>
void to_json_optional(
    nlohmann::json& j, const std::string& key, const std::optional<T>& value) {
  if (value.has_value()) {
    j[key] = *value;
  }
}

// A missing key and an explicit null both read back as nullopt
template <typename T>
void from_json_optional(
    const nlohmann::json& j, const std::string& key, std::optional<T>& value) {
  if (j.contains(key) && !j.at(key).is_null()) {
    value = j.at(key).get<T>();
  } else {
    value = std::nullopt;
  }
}

}  // namespace lsp
