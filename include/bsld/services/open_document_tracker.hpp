#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bsld::services {

// Documents currently open in the editor with their latest version.
// Thread-safe.
class OpenDocumentTracker {
 public:
  OpenDocumentTracker() = default;

  auto Add(const std::string& uri, int version) -> void;

  // Records a newer version of an open document
  auto Update(const std::string& uri, int version) -> void;

  auto Remove(const std::string& uri) -> void;

  [[nodiscard]] auto Contains(const std::string& uri) const -> bool;

  [[nodiscard]] auto GetVersion(const std::string& uri) const
      -> std::optional<int>;

  [[nodiscard]] auto GetOpenUris() const -> std::vector<std::string>;

  auto Clear() -> void;

  [[nodiscard]] auto Size() const -> std::size_t;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, int> open_documents_;
};

}  // namespace bsld::services
