#include "osr/sandbox/sandbox_commands.hpp"

#include <algorithm>
#include <cctype>

namespace osr {

namespace {

std::string lowered(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

char typeFlag(const std::string& element_type) {
  const std::string type = lowered(element_type);
  if (type == "station" || type == "s") return 's';
  if (type == "gateway" || type == "g") return 'g';
  return 'e';
}

}  // namespace

SandboxCommandGenerator::SandboxCommandGenerator(const std::string& osr_id)
    : osr_id_(lowered(osr_id)) {
  if (osr_id_.rfind("osr", 0) != 0) {
    osr_id_ = "osr" + osr_id_;
  }
}

std::string SandboxCommandGenerator::simPrefix() const { return "sim" + osr_id_; }

std::string SandboxCommandGenerator::insertCommand(
    const std::string& element, const std::string& carrier) const {
  return simPrefix() + " -i " + element + " " + carrier;
}

std::string SandboxCommandGenerator::removeCommand(
    const std::string& element, const std::string& carrier) const {
  return simPrefix() + " -r " + element + " " + carrier;
}

std::string SandboxCommandGenerator::enableCommand(
    const std::string& element, const std::string& element_type) const {
  return simPrefix() + " --enable-element " + typeFlag(element_type) + " " +
         element;
}

std::string SandboxCommandGenerator::disableCommand(
    const std::string& element, const std::string& element_type) const {
  return simPrefix() + " --disable-element " + typeFlag(element_type) + " " +
         element;
}

InsertionCommands SandboxCommandGenerator::insertionCommandsFor(
    const domain::OrderDocument& document, const std::string& element) const {
  std::string carrier;
  if (!document.root().children.empty()) {
    const auto& order = document.root().children.front();
    for (const char* key : {"container_number", "compartment_number"}) {
      const std::string* value = order.attribute(key);
      if (value != nullptr && !value->empty()) {
        carrier = *value;
        break;
      }
    }
  }
  if (carrier.empty()) {
    const std::string order_number = document.orderNumber();
    carrier = order_number.empty() ? "carrier_test" : "carrier_" + order_number;
  }

  const std::string& target = element.empty() ? std::string(kDefaultSandboxElement)
                                              : element;
  return {insertCommand(target, carrier), removeCommand(target, carrier)};
}

}  // namespace osr
