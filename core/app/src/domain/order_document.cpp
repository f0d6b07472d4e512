#include "osr/domain/order_document.hpp"
#include "osr/domain/errors.hpp"

#include <sstream>

namespace osr {
namespace domain {

namespace {

void appendEscaped(std::ostringstream& out, const std::string& value) {
  for (char c : value) {
    switch (c) {
      case '&':  out << "&amp;"; break;
      case '<':  out << "&lt;"; break;
      case '>':  out << "&gt;"; break;
      case '"':  out << "&quot;"; break;
      case '\'': out << "&apos;"; break;
      default:   out << c; break;
    }
  }
}

void renderElement(std::ostringstream& out, const DocumentElement& element) {
  out << '<' << element.name;
  for (const auto& [key, value] : element.attributes) {
    out << ' ' << key << "=\"";
    appendEscaped(out, value);
    out << '"';
  }
  if (element.children.empty()) {
    out << "/>";
    return;
  }
  out << '>';
  for (const auto& child : element.children) {
    renderElement(out, child);
  }
  out << "</" << element.name << '>';
}

}  // namespace

// -----------------------------------------------------------------------------
// DocumentElement
// -----------------------------------------------------------------------------
const std::string* DocumentElement::attribute(const std::string& key) const {
  for (const auto& [k, v] : attributes) {
    if (k == key) {
      return &v;
    }
  }
  return nullptr;
}

void DocumentElement::setAttribute(const std::string& key, std::string value) {
  for (auto& [k, v] : attributes) {
    if (k == key) {
      v = std::move(value);
      return;
    }
  }
  attributes.emplace_back(key, std::move(value));
}

DocumentElement& DocumentElement::addChild(std::string child_name) {
  children.push_back(DocumentElement{std::move(child_name), {}, {}});
  return children.back();
}

bool DocumentElement::operator==(const DocumentElement& other) const {
  return name == other.name && attributes == other.attributes &&
         children == other.children;
}

// -----------------------------------------------------------------------------
// OrderDocument
// -----------------------------------------------------------------------------
OrderDocument::OrderDocument(OrderKind kind, DocumentElement root,
                             bool dry_run)
    : kind_(kind), root_(std::move(root)), dry_run_(dry_run) {}

DocumentElement& OrderDocument::mutableRoot() {
  if (state_ == DocumentState::Finalized) {
    throw DocumentStateError("document " + orderNumber() +
                             " is finalized and can no longer be edited");
  }
  return root_;
}

std::string OrderDocument::orderNumber() const {
  if (root_.children.empty()) {
    return {};
  }
  const std::string* value = root_.children.front().attribute("order_number");
  return value != nullptr ? *value : std::string{};
}

std::string OrderDocument::toXml() const {
  std::ostringstream out;
  renderElement(out, root_);
  return out.str();
}

bool OrderDocument::operator==(const OrderDocument& other) const {
  return kind_ == other.kind_ && dry_run_ == other.dry_run_ &&
         state_ == other.state_ && root_ == other.root_;
}

}  // namespace domain
}  // namespace osr
