#pragma once

#include "osr/domain/order_document.hpp"
#include "osr/domain/order_record.hpp"

#include <nlohmann/json.hpp>

namespace osr {

// -----------------------------------------------------------------------------
// JSON codec for the persisted history
// -----------------------------------------------------------------------------
//
// Record layout:
//
//   {"id": "osr1-000001",
//    "kind": "Standard",
//    "document": {"kind": "Standard", "dry_run": false,
//                 "root": {"name": "host2osr",
//                          "attributes": [["k", "v"], ...],
//                          "children": [ ... ]}},
//    "status": "Sent",
//    "created_at": "2026-10-19T08:15:30.123Z",
//    "last_updated_at": "2026-10-19T08:15:30.456Z",
//    "remote_reference": "R-123",      // null when absent
//    "attempts": 1,
//    "last_error": null}
//
// Attributes are stored as [name, value] pairs because their order is part
// of the document. Decoded documents are always Finalized.
//
// The decoders throw StorageError naming the offending field; a history file
// that fails to decode is treated as corrupt.
// -----------------------------------------------------------------------------
nlohmann::json documentToJson(const domain::OrderDocument& document);
domain::OrderDocument documentFromJson(const nlohmann::json& node);

nlohmann::json recordToJson(const domain::OrderRecord& record);
domain::OrderRecord recordFromJson(const nlohmann::json& node);

}  // namespace osr
