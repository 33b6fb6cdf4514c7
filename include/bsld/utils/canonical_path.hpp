#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace bsld {

// Absolute path of a workspace file or directory with symlinks resolved.
// Paths that do not exist yet are normalized lexically.
class CanonicalPath {
 public:
  CanonicalPath() = default;

  explicit CanonicalPath(std::filesystem::path path);

  static auto FromUri(std::string_view uri) -> CanonicalPath;

  [[nodiscard]] auto ToUri() const -> std::string;

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }
  [[nodiscard]] auto String() const -> std::string {
    return path_.string();
  }
  [[nodiscard]] auto Empty() const -> bool {
    return path_.empty();
  }

  // Component-wise: /ws/project2 is not below /ws/project
  [[nodiscard]] auto IsSubPathOf(const CanonicalPath& root) const -> bool;

  // Forward-slash path below `root`, the form used by config filters and
  // module mappings
  [[nodiscard]] auto RelativeTo(const CanonicalPath& root) const
      -> std::string;

  auto operator/(const std::filesystem::path& rhs) const -> CanonicalPath;

  friend auto operator==(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool = default;

  friend auto operator<(const CanonicalPath& lhs, const CanonicalPath& rhs)
      -> bool {
    return lhs.path_ < rhs.path_;
  }

 private:
  std::filesystem::path path_;
};

}  // namespace bsld

template <>
struct fmt::formatter<bsld::CanonicalPath> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(const bsld::CanonicalPath& p, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(p.String(), ctx);
  }
};
