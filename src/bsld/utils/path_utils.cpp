#include "bsld/utils/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <regex>

#include <fmt/format.h>

namespace bsld {

namespace {

auto HasExtension(
    const std::filesystem::path& path,
    std::initializer_list<std::string_view> exts) -> bool {
  std::string ext = path.extension().string();
  if (ext.empty()) {
    return false;
  }
  std::ranges::transform(
      ext, ext.begin(), [](unsigned char c) { return std::tolower(c); });
  return std::ranges::find(exts, ext) != exts.end();
}

}  // namespace

auto IsBslFile(const std::filesystem::path& path) -> bool {
  return HasExtension(path, {".bsl", ".os"});
}

auto UriToPath(std::string_view uri) -> std::filesystem::path {
  if (!uri.starts_with("file://")) {
    return {uri};
  }

  std::string path(uri.substr(7));

  // file:///C:/path -> C:/path
  if (path.size() >= 3 && path[0] == '/' && path[2] == ':') {
    path = path.substr(1);
  }

  static const std::regex kEscapeRegex("%([0-9A-Fa-f]{2})");

  std::string result;
  std::regex_iterator<std::string::iterator> it(
      path.begin(), path.end(), kEscapeRegex);
  std::regex_iterator<std::string::iterator> end;

  std::size_t last_pos = 0;
  while (it != end) {
    result.append(path, last_pos, it->position() - last_pos);
    std::string hex = (*it)[1];
    result += static_cast<char>(std::stoi(hex, nullptr, 16));
    last_pos = it->position() + it->length();
    ++it;
  }

  result.append(path, last_pos, path.length() - last_pos);
  return NormalizePath(std::filesystem::path(result));
}

auto PathToUri(const std::filesystem::path& path) -> std::string {
  std::string result = "file://";
  auto generic = path.generic_string();

  if (generic.size() >= 2 && generic[1] == ':') {
    result += '/';
  }

  // Non-ASCII bytes (Cyrillic file names) are percent-encoded per byte
  for (char c : generic) {
    if (c == ' ' || c == '%' || c == '#' || c == '?' ||
        static_cast<unsigned char>(c) > 127 ||
        static_cast<unsigned char>(c) < 32) {
      result += fmt::format("%{:02X}", static_cast<unsigned char>(c));
    } else {
      result += c;
    }
  }

  return result;
}

auto NormalizeUri(std::string_view uri) -> std::string {
  if (!uri.starts_with("file://")) {
    return std::string(uri);
  }
  return PathToUri(UriToPath(uri));
}

auto NormalizePath(std::filesystem::path path) -> std::filesystem::path {
  std::error_code ec;
  // Synthetic paths (unsaved buffers, tests) are kept as given
  if (!std::filesystem::exists(path, ec)) {
    return path.lexically_normal();
  }
  auto canonical = std::filesystem::canonical(path, ec);
  if (ec) {
    return path.lexically_normal();
  }
  return canonical;
}

auto RelativeGenericPath(
    const std::filesystem::path& path, const std::filesystem::path& root)
    -> std::string {
  auto relative = path.lexically_relative(root);
  if (relative.empty()) {
    return path.generic_string();
  }
  return relative.generic_string();
}

}  // namespace bsld
