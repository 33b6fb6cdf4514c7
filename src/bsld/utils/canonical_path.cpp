#include "bsld/utils/canonical_path.hpp"

#include <algorithm>
#include <utility>

#include "bsld/utils/path_utils.hpp"

namespace bsld {

CanonicalPath::CanonicalPath(std::filesystem::path path)
    : path_(NormalizePath(std::move(path))) {
}

auto CanonicalPath::FromUri(std::string_view uri) -> CanonicalPath {
  return CanonicalPath(UriToPath(uri));
}

auto CanonicalPath::ToUri() const -> std::string {
  return PathToUri(path_);
}

auto CanonicalPath::IsSubPathOf(const CanonicalPath& root) const -> bool {
  if (root.Empty()) {
    return false;
  }
  auto [root_it, self_it] = std::mismatch(
      root.path_.begin(), root.path_.end(), path_.begin(), path_.end());
  return root_it == root.path_.end();
}

auto CanonicalPath::RelativeTo(const CanonicalPath& root) const
    -> std::string {
  return RelativeGenericPath(path_, root.path_);
}

auto CanonicalPath::operator/(const std::filesystem::path& rhs) const
    -> CanonicalPath {
  return CanonicalPath(path_ / rhs);
}

}  // namespace bsld
