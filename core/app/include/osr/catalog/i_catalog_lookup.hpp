#pragma once

#include <optional>
#include <string>

namespace osr {

enum class CatalogEntryKind {
  Item,
  Location,
};

// One reference-data entry: a product code or a container/location code.
struct CatalogEntry {
  std::string code;
  std::string name;
  CatalogEntryKind kind{CatalogEntryKind::Item};
};

// -----------------------------------------------------------------------------
// ICatalogLookup — reference-data lookup boundary
// -----------------------------------------------------------------------------
//
// @brief  Answers "does this item or location code exist?" for the document
//         builder.
//
// @details
// The production catalog lives in the warehouse database; this interface is
// the only thing the order desk knows about it. StaticCatalog (a JSON file)
// implements it for offline use and tests.
//
// When the builder is given a lookup, every catalog-checked field must
// resolve or the build fails with "not found in catalog".
//
// Thread model:
//   lookup() is const and must be safe to call concurrently.
// -----------------------------------------------------------------------------
class ICatalogLookup {
 public:
  virtual ~ICatalogLookup() = default;

  virtual std::optional<CatalogEntry> lookup(const std::string& code) const = 0;
};

}  // namespace osr
