#pragma once

#include "osr/domain/order_document.hpp"

#include <string>

namespace osr {

// Commands to place a carrier for an order and to take it away afterwards.
struct InsertionCommands {
  std::string insert_now;
  std::string remove_later;
};

// Element used when the operator does not name one.
inline constexpr const char* kDefaultSandboxElement =
    "workflow.input.station.01";

// -----------------------------------------------------------------------------
// SandboxCommandGenerator — simulator command lines for Test OSRs
// -----------------------------------------------------------------------------
// Responsibility: Formats the shell commands an operator pastes into a Test
// server's simulator. Pure string formatting; nothing is executed.
//
// The OSR id is lower-cased and normalised to "osr<N>" ("2" → "osr2",
// "OSR1" → "osr1"), and every command starts with "sim<osrid>".
//
// Element types accept "element"/"e", "station"/"s" and "gateway"/"g"
// (case-insensitive); anything else is treated as "e".
// -----------------------------------------------------------------------------
class SandboxCommandGenerator {
 public:
  explicit SandboxCommandGenerator(const std::string& osr_id);

  const std::string& osrId() const { return osr_id_; }

  // "sim<osrid>"
  std::string simPrefix() const;

  std::string insertCommand(const std::string& element,
                            const std::string& carrier) const;
  std::string removeCommand(const std::string& element,
                            const std::string& carrier) const;
  std::string enableCommand(const std::string& element,
                            const std::string& element_type = "element") const;
  std::string disableCommand(const std::string& element,
                             const std::string& element_type = "element") const;

  // Carrier comes from the order element's container_number or
  // compartment_number; otherwise "carrier_<order_number>". An empty
  // element selects kDefaultSandboxElement.
  InsertionCommands insertionCommandsFor(const domain::OrderDocument& document,
                                         const std::string& element = {}) const;

 private:
  std::string osr_id_;
};

}  // namespace osr
