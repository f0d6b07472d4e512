#pragma once

#include "osr/catalog/i_catalog_lookup.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace osr {

// -----------------------------------------------------------------------------
// StaticCatalog — in-memory ICatalogLookup
// -----------------------------------------------------------------------------
// Responsibility: Serves lookups from a fixed set of entries, loaded from a
// JSON array:
//
//   [{"code": "A100", "name": "Bolt M6", "kind": "item"},
//    {"code": "L01",  "name": "Tray L01", "kind": "location"}]
//
// Immutable after construction, so concurrent lookups need no locking.
// Codes are unique; a later duplicate replaces the earlier entry.
// -----------------------------------------------------------------------------
class StaticCatalog final : public ICatalogLookup {
 public:
  explicit StaticCatalog(const std::vector<CatalogEntry>& entries);

  // @throws ConfigError if the file cannot be read or has the wrong shape.
  static StaticCatalog fromJsonFile(const std::string& path);

  // @throws ConfigError on malformed JSON or a wrong shape.
  static StaticCatalog fromJsonText(const std::string& text);

  std::optional<CatalogEntry> lookup(const std::string& code) const override;

  std::size_t size() const { return entries_.size(); }

 private:
  std::unordered_map<std::string, CatalogEntry> entries_;
};

}  // namespace osr
