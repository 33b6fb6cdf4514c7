#pragma once

#include <span>
#include <string_view>

namespace bsld::semantic {

// A top-level metadata collection of a configuration, e.g. Catalogs. The
// directory name of the designer export equals the English collection name.
struct MetadataCollection {
  std::string_view en;
  std::string_view ru;
  // Singular type used in module references ("Catalog.Goods")
  std::string_view type;
  // Whether code can reach its manager module as `Collection.Name.Method(`
  bool has_manager_access;
};

[[nodiscard]] auto AllMetadataCollections()
    -> std::span<const MetadataCollection>;

// Case-insensitive lookup by English or Russian name, managers only
[[nodiscard]] auto FindManagerCollection(std::string_view word)
    -> const MetadataCollection*;

// Exact lookup by export directory name
[[nodiscard]] auto FindCollectionByDirectory(std::string_view directory)
    -> const MetadataCollection*;

}  // namespace bsld::semantic
