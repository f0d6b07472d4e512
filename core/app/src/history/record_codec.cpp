#include "osr/history/record_codec.hpp"
#include "osr/domain/errors.hpp"
#include "osr/time/time_utils.hpp"

namespace osr {

using json = nlohmann::json;
using domain::DocumentElement;
using domain::OrderDocument;
using domain::OrderRecord;

namespace {

json elementToJson(const DocumentElement& element) {
  json attributes = json::array();
  for (const auto& [key, value] : element.attributes) {
    attributes.push_back(json::array({key, value}));
  }
  json children = json::array();
  for (const auto& child : element.children) {
    children.push_back(elementToJson(child));
  }
  return {{"name", element.name},
          {"attributes", std::move(attributes)},
          {"children", std::move(children)}};
}

DocumentElement elementFromJson(const json& node) {
  DocumentElement element;
  element.name = node.at("name").get<std::string>();
  for (const auto& pair : node.at("attributes")) {
    if (!pair.is_array() || pair.size() != 2) {
      throw StorageError("element " + element.name +
                         " has a malformed attribute entry");
    }
    element.attributes.emplace_back(pair[0].get<std::string>(),
                                    pair[1].get<std::string>());
  }
  for (const auto& child : node.at("children")) {
    element.children.push_back(elementFromJson(child));
  }
  return element;
}

std::int64_t timestampFromJson(const json& node, const char* key) {
  const std::string text = node.at(key).get<std::string>();
  auto ms = parse_iso8601_ms(text);
  if (!ms) {
    throw StorageError(std::string(key) + " is not an ISO-8601 timestamp: " +
                       text);
  }
  return *ms;
}

std::optional<std::string> optionalString(const json& node, const char* key) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

json optionalToJson(const std::optional<std::string>& value) {
  return value ? json(*value) : json(nullptr);
}

}  // namespace

// -----------------------------------------------------------------------------
// Documents
// -----------------------------------------------------------------------------
json documentToJson(const OrderDocument& document) {
  return {{"kind", domain::toString(document.kind())},
          {"dry_run", document.dryRun()},
          {"root", elementToJson(document.root())}};
}

OrderDocument documentFromJson(const json& node) {
  try {
    auto kind = domain::parseOrderKind(node.at("kind").get<std::string>());
    if (!kind) {
      throw StorageError("document has an unknown kind");
    }
    OrderDocument document(*kind, elementFromJson(node.at("root")),
                           node.value("dry_run", false));
    document.finalize();
    return document;
  } catch (const json::exception& e) {
    throw StorageError(std::string("malformed document: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// Records
// -----------------------------------------------------------------------------
json recordToJson(const OrderRecord& record) {
  return {{"id", record.id},
          {"kind", domain::toString(record.kind)},
          {"document", documentToJson(record.document)},
          {"status", domain::toString(record.status)},
          {"created_at", format_iso8601_ms(record.created_at_ms)},
          {"last_updated_at", format_iso8601_ms(record.last_updated_at_ms)},
          {"remote_reference", optionalToJson(record.remote_reference)},
          {"attempts", record.attempts},
          {"last_error", optionalToJson(record.last_error)}};
}

OrderRecord recordFromJson(const json& node) {
  OrderRecord record;
  try {
    record.id = node.at("id").get<std::string>();
    auto kind = domain::parseOrderKind(node.at("kind").get<std::string>());
    auto status = domain::parseOrderStatus(node.at("status").get<std::string>());
    if (!kind || !status) {
      throw StorageError("record " + record.id +
                         " has an unknown kind or status");
    }
    record.kind = *kind;
    record.status = *status;
    record.document = documentFromJson(node.at("document"));
    record.created_at_ms = timestampFromJson(node, "created_at");
    record.last_updated_at_ms = timestampFromJson(node, "last_updated_at");
    record.remote_reference = optionalString(node, "remote_reference");
    record.attempts = node.at("attempts").get<int>();
    record.last_error = optionalString(node, "last_error");
  } catch (const json::exception& e) {
    throw StorageError("malformed record " + record.id + ": " + e.what());
  }
  return record;
}

}  // namespace osr
