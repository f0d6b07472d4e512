#include "osr/document/document_builder.hpp"
#include "osr/catalog/i_catalog_lookup.hpp"
#include "osr/domain/errors.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <unordered_map>

namespace osr {

using domain::DocumentElement;
using domain::OrderDocument;
using domain::OrderKind;
using domain::OrderSpec;

namespace {

constexpr int kMaxLines = 999;

// Validated values of one pick line (or of the whole order for single-line
// kinds), keyed by unsuffixed field name.
using Values = std::unordered_map<std::string, std::string>;

// -----------------------------------------------------------------------------
// Input index
// -----------------------------------------------------------------------------
// Positions of every input field by exact name, plus a consumed flag per
// input position so leftovers can be reported in input order.
// -----------------------------------------------------------------------------
struct InputIndex {
  explicit InputIndex(const domain::FieldList& fields) : consumed(fields.size(), false) {
    for (std::size_t i = 0; i < fields.size(); ++i) {
      positions[fields[i].first].push_back(i);
    }
  }

  std::unordered_map<std::string, std::vector<std::size_t>> positions;
  std::vector<bool> consumed;
};

// "item#3" → 3 for a per-line field of a multi-line schema, else nullopt.
std::optional<int> lineNumberOf(const OrderSchema& schema,
                                const std::string& name) {
  auto hash = name.find('#');
  if (!schema.multi_line || hash == std::string::npos || hash + 1 >= name.size()) {
    return std::nullopt;
  }
  const FieldSpec* field = schema.find(name.substr(0, hash));
  if (field == nullptr || !field->per_line) {
    return std::nullopt;
  }
  std::string digits = name.substr(hash + 1);
  if (digits.size() > 3 || digits.front() == '0') {
    return std::nullopt;
  }
  for (char c : digits) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return std::nullopt;
    }
  }
  int line = std::stoi(digits);
  if (line < 2 || line > kMaxLines) {
    return std::nullopt;
  }
  return line;
}

std::string suffixed(const std::string& name, int line) {
  return line == 1 ? name : name + "#" + std::to_string(line);
}

std::string attr(const Values& values, const std::string& name) {
  auto it = values.find(name);
  return it == values.end() ? std::string{} : it->second;
}

}  // namespace

DocumentBuilder::DocumentBuilder(const EngineConfig& config,
                                 const ICatalogLookup* catalog)
    : order_prefix_(config.order_prefix),
      capacity_specs_(config.capacity_specs),
      catalog_(catalog) {}

// -----------------------------------------------------------------------------
// build(): validate in schema order, reject leftovers, lay out the tree
// -----------------------------------------------------------------------------
OrderDocument DocumentBuilder::build(const OrderSpec& spec) const {
  const OrderSchema& schema = schemaFor(spec.kind);
  InputIndex index(spec.fields);

  // Validates one declared field on `line` and records its value.
  auto take = [&](const FieldSpec& field, int line, Values& out) {
    const std::string name = suffixed(field.name, line);
    auto it = index.positions.find(name);
    if (it == index.positions.end()) {
      if (field.required) {
        throw ValidationError(name, "required field is missing");
      }
      out[field.name] = field.default_from.empty() ? field.default_value
                                                   : attr(out, field.default_from);
      return;
    }
    if (it->second.size() > 1) {
      throw ValidationError(name, "field is given more than once");
    }
    std::size_t pos = it->second.front();
    std::string value =
        normaliseFieldValue(field.type, spec.fields[pos].second);
    if (auto reason = checkFieldValue(field.type, value)) {
      throw ValidationError(name, *reason);
    }
    if (field.catalog_checked && catalog_ != nullptr &&
        !catalog_->lookup(value)) {
      throw ValidationError(name, "not found in catalog");
    }
    index.consumed[pos] = true;
    out[field.name] = std::move(value);
  };

  // Header fields live in the first line's map; lines 2..N only carry the
  // per-line fields.
  std::vector<Values> lines(1);
  for (const auto& field : schema.fields) {
    take(field, 1, lines.front());
  }

  int last_line = 1;
  for (const auto& input : spec.fields) {
    if (auto line = lineNumberOf(schema, input.first)) {
      last_line = std::max(last_line, *line);
    }
  }
  for (int line = 2; line <= last_line; ++line) {
    lines.emplace_back();
    for (const auto& field : schema.fields) {
      if (field.per_line) {
        take(field, line, lines.back());
      }
    }
  }

  for (std::size_t i = 0; i < spec.fields.size(); ++i) {
    if (!index.consumed[i]) {
      throw ValidationError(spec.fields[i].first,
                            std::string("unknown field for ") +
                                domain::toString(spec.kind));
    }
  }

  // --- Layout --------------------------------------------------------------
  const Values& header = lines.front();
  const std::string order_number =
      order_prefix_ + "-" + schema.order_tag + "-" + attr(header, "order_number");

  DocumentElement root{"host2osr", {}, {}};

  auto addCapacitySpecs = [this](DocumentElement& product) {
    for (const auto& capacity : capacity_specs_) {
      DocumentElement& element = product.addChild("capacity_spec");
      element.setAttribute("compartment_type", capacity.compartment_type);
      element.setAttribute("maximum_quantity", capacity.maximum_quantity);
    }
  };

  auto addGoodsInLine = [&](DocumentElement& order) {
    DocumentElement& line = order.addChild("goods_in_order_line");
    line.setAttribute("quantity_advertised", attr(header, "qty"));
    DocumentElement& product = line.addChild("product");
    product.setAttribute("product_code", attr(header, "item"));
    product.setAttribute("name", attr(header, "item_name"));
    product.setAttribute("returned", "false");
    product.setAttribute("bundle_size", "1");
    addCapacitySpecs(product);
  };

  switch (spec.kind) {
    case OrderKind::Standard:
    case OrderKind::Manual: {
      const bool standard = spec.kind == OrderKind::Standard;
      DocumentElement& order = root.addChild("pick_order");
      order.setAttribute("order_number", order_number);
      if (standard) {
        order.setAttribute("container_number", attr(header, "location"));
      }
      order.setAttribute("processing_mode", standard ? "standard" : "manual");
      for (const Values& values : lines) {
        DocumentElement& line = order.addChild("pick_order_line");
        line.setAttribute("quantity", attr(values, "qty"));
        if (standard) {
          line.setAttribute("target_slot", "1");
        }
        DocumentElement& product = line.addChild("product");
        product.setAttribute("product_code", attr(values, "item"));
        product.setAttribute("name", attr(values, "item_name"));
        if (standard) {
          product.setAttribute("returned", "false");
        }
      }
      break;
    }

    case OrderKind::Inventory: {
      DocumentElement& order = root.addChild("inventory_order");
      order.setAttribute("order_number", order_number);
      order.setAttribute("processing_mode", "standard");
      order.setAttribute("container_number", attr(header, "location"));
      order.addChild("product").setAttribute("product_code", attr(header, "item"));
      break;
    }

    case OrderKind::GoodsIn: {
      DocumentElement& order = root.addChild("goods_in_order");
      order.setAttribute("order_number", order_number);
      order.setAttribute("compartment_number", attr(header, "location"));
      order.setAttribute("compartment_type", attr(header, "container_type"));
      order.setAttribute("processing_mode", "standard");
      addGoodsInLine(order);
      break;
    }

    case OrderKind::GoodsAdd: {
      DocumentElement& order = root.addChild("goods_in_order");
      order.setAttribute("order_number", order_number);
      order.setAttribute("processing_mode", "renewal");
      addGoodsInLine(order);
      break;
    }
  }

  return OrderDocument(spec.kind, std::move(root), spec.dry_run);
}

}  // namespace osr
