#include "osr/catalog/static_catalog.hpp"
#include "osr/domain/errors.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace osr {

using json = nlohmann::json;

StaticCatalog::StaticCatalog(const std::vector<CatalogEntry>& entries) {
  for (const auto& entry : entries) {
    entries_[entry.code] = entry;
  }
}

StaticCatalog StaticCatalog::fromJsonFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open catalog file " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return fromJsonText(buffer.str());
}

// -----------------------------------------------------------------------------
// fromJsonText(): array of {code, name, kind}; kind defaults to "item"
// -----------------------------------------------------------------------------
StaticCatalog StaticCatalog::fromJsonText(const std::string& text) {
  std::vector<CatalogEntry> entries;
  try {
    json root = json::parse(text);
    if (!root.is_array()) {
      throw ConfigError("catalog must be a JSON array");
    }
    for (const auto& node : root) {
      CatalogEntry entry;
      entry.code = node.at("code").get<std::string>();
      entry.name = node.value("name", entry.code);
      std::string kind = node.value("kind", std::string("item"));
      if (kind == "item") {
        entry.kind = CatalogEntryKind::Item;
      } else if (kind == "location") {
        entry.kind = CatalogEntryKind::Location;
      } else {
        throw ConfigError("catalog entry " + entry.code +
                          " has unknown kind \"" + kind + "\"");
      }
      entries.push_back(std::move(entry));
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("malformed catalog: ") + e.what());
  }
  return StaticCatalog(entries);
}

std::optional<CatalogEntry> StaticCatalog::lookup(
    const std::string& code) const {
  auto it = entries_.find(code);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace osr
