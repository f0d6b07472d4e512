#include "osr/document/order_schema.hpp"

#include <cctype>
#include <cstdint>

namespace osr {

using domain::OrderKind;

namespace {

constexpr std::size_t kMaxQuantityDigits = 6;
constexpr std::size_t kMaxIdentifierLength = 32;
constexpr std::size_t kMaxLocationLength = 64;
constexpr std::size_t kMaxTextLength = 128;
constexpr std::size_t kMaxTokenLength = 32;

bool isAlnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }

bool isControl(char c) { return std::iscntrl(static_cast<unsigned char>(c)) != 0; }

bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// Well-formed UTF-8: no stray continuation bytes, no truncated or overlong
// sequences, no surrogates, nothing above U+10FFFF.
bool isValidUtf8(const std::string& value) {
  std::size_t i = 0;
  while (i < value.size()) {
    const auto lead = static_cast<unsigned char>(value[i]);
    std::size_t length = 0;
    std::uint32_t code_point = 0;
    if (lead < 0x80) {
      ++i;
      continue;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
      code_point = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      code_point = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      code_point = lead & 0x07;
    } else {
      return false;
    }
    if (i + length > value.size()) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      const auto next = static_cast<unsigned char>(value[i + k]);
      if ((next & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (next & 0x3F);
    }
    if ((length == 3 && code_point < 0x800) ||
        (length == 4 && (code_point < 0x10000 || code_point > 0x10FFFF)) ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      return false;
    }
    i += length;
  }
  return true;
}

FieldSpec required(std::string name, FieldType type, bool per_line = false) {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = type;
  spec.per_line = per_line;
  return spec;
}

FieldSpec optional(std::string name, FieldType type, bool per_line,
                   std::string default_value, std::string default_from = {}) {
  FieldSpec spec;
  spec.name = std::move(name);
  spec.type = type;
  spec.required = false;
  spec.per_line = per_line;
  spec.default_value = std::move(default_value);
  spec.default_from = std::move(default_from);
  return spec;
}

FieldSpec catalogItem(bool per_line) {
  FieldSpec spec = required("item", FieldType::Identifier, per_line);
  spec.catalog_checked = true;
  return spec;
}

FieldSpec itemName(bool per_line) {
  return optional("item_name", FieldType::Text, per_line, {}, "item");
}

FieldSpec orderNumber() {
  return optional("order_number", FieldType::Identifier, false, "1");
}

// -----------------------------------------------------------------------------
// Schema table. Field order here is the validation order.
// -----------------------------------------------------------------------------
std::vector<OrderSchema> buildSchemas() {
  std::vector<OrderSchema> schemas;

  schemas.push_back(OrderSchema{OrderKind::Standard, "pick", true,
                                {required("qty", FieldType::Quantity, true),
                                 required("location", FieldType::Location),
                                 catalogItem(true),
                                 itemName(true),
                                 orderNumber()}});

  schemas.push_back(OrderSchema{OrderKind::Manual, "pick-manual", true,
                                {required("qty", FieldType::Quantity, true),
                                 catalogItem(true),
                                 itemName(true),
                                 orderNumber()}});

  schemas.push_back(OrderSchema{OrderKind::Inventory, "inv", false,
                                {required("location", FieldType::Location),
                                 catalogItem(false),
                                 orderNumber()}});

  schemas.push_back(
      OrderSchema{OrderKind::GoodsIn, "goods-in", false,
                  {required("qty", FieldType::Quantity),
                   required("location", FieldType::Location),
                   catalogItem(false),
                   itemName(false),
                   optional("container_type", FieldType::Token, false, "full"),
                   orderNumber()}});

  schemas.push_back(OrderSchema{OrderKind::GoodsAdd, "goods-add", false,
                                {required("qty", FieldType::Quantity),
                                 catalogItem(false),
                                 itemName(false),
                                 orderNumber()}});
  return schemas;
}

}  // namespace

const char* toString(FieldType type) {
  switch (type) {
    case FieldType::Quantity:   return "Quantity";
    case FieldType::Identifier: return "Identifier";
    case FieldType::Location:   return "Location";
    case FieldType::Text:       return "Text";
    case FieldType::Token:      return "Token";
  }
  return "Unknown";
}

const FieldSpec* OrderSchema::find(const std::string& name) const {
  for (const auto& field : fields) {
    if (field.name == name) {
      return &field;
    }
  }
  return nullptr;
}

const OrderSchema& schemaFor(OrderKind kind) {
  static const std::vector<OrderSchema> kSchemas = buildSchemas();
  for (const auto& schema : kSchemas) {
    if (schema.kind == kind) {
      return schema;
    }
  }
  // The table covers every enumerator.
  return kSchemas.front();
}

std::string normaliseFieldValue(FieldType type, const std::string& raw) {
  if (type != FieldType::Location) {
    return raw;
  }
  std::size_t first = 0;
  std::size_t last = raw.size();
  while (first < last && isSpace(raw[first])) ++first;
  while (last > first && isSpace(raw[last - 1])) --last;
  return raw.substr(first, last - first);
}

// -----------------------------------------------------------------------------
// checkFieldValue(): per-type format rules
// -----------------------------------------------------------------------------
std::optional<std::string> checkFieldValue(FieldType type,
                                           const std::string& value) {
  switch (type) {
    case FieldType::Quantity: {
      bool digits = !value.empty() && value.size() <= kMaxQuantityDigits;
      for (char c : value) {
        digits = digits && std::isdigit(static_cast<unsigned char>(c)) != 0;
      }
      if (!digits || std::stoi(value) < 1) {
        return std::string("must be a whole number from 1 to 999999");
      }
      return std::nullopt;
    }

    case FieldType::Identifier: {
      bool ok = !value.empty() && value.size() <= kMaxIdentifierLength &&
                isAlnum(value.front());
      for (char c : value) {
        ok = ok && (isAlnum(c) || c == '.' || c == '_' || c == '-');
      }
      if (!ok) {
        return std::string(
            "must be 1-32 letters, digits, '.', '_' or '-' and start with a "
            "letter or digit");
      }
      return std::nullopt;
    }

    case FieldType::Location: {
      if (value.empty()) {
        return std::string("must not be empty");
      }
      if (value.size() > kMaxLocationLength) {
        return std::string("must be at most 64 characters");
      }
      if (!isValidUtf8(value)) {
        return std::string("must be valid UTF-8");
      }
      for (char c : value) {
        if (isSpace(c) || isControl(c)) {
          return std::string("must not contain whitespace or control characters");
        }
      }
      return std::nullopt;
    }

    case FieldType::Text: {
      if (value.size() > kMaxTextLength) {
        return std::string("must be at most 128 characters");
      }
      if (!isValidUtf8(value)) {
        return std::string("must be valid UTF-8");
      }
      for (char c : value) {
        if (isControl(c)) {
          return std::string("must not contain control characters");
        }
      }
      return std::nullopt;
    }

    case FieldType::Token: {
      bool ok = !value.empty() && value.size() <= kMaxTokenLength;
      for (char c : value) {
        ok = ok && (isAlnum(c) || c == '_' || c == '-');
      }
      if (!ok) {
        return std::string("must be 1-32 letters, digits, '_' or '-'");
      }
      return std::nullopt;
    }
  }
  return std::string("unsupported field type");
}

}  // namespace osr
