#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace bsld {

// File type checks
[[nodiscard]] auto IsBslFile(const std::filesystem::path& path) -> bool;

// URI operations
[[nodiscard]] auto UriToPath(std::string_view uri) -> std::filesystem::path;
[[nodiscard]] auto PathToUri(const std::filesystem::path& path) -> std::string;
// Canonical form of a file:// URI; other URIs are returned unchanged
[[nodiscard]] auto NormalizeUri(std::string_view uri) -> std::string;
[[nodiscard]] auto NormalizePath(std::filesystem::path path)
    -> std::filesystem::path;

// Path relative to root with forward slashes, used for config path filters
[[nodiscard]] auto RelativeGenericPath(
    const std::filesystem::path& path, const std::filesystem::path& root)
    -> std::string;

}  // namespace bsld
