#include "osr/transport/i_transport_client.hpp"

namespace osr {

const char* toString(RemoteStatus status) {
  switch (status) {
    case RemoteStatus::Accepted:   return "Accepted";
    case RemoteStatus::Processing: return "Processing";
    case RemoteStatus::Completed:  return "Completed";
    case RemoteStatus::Cancelled:  return "Cancelled";
    case RemoteStatus::Rejected:   return "Rejected";
  }
  return "Unknown";
}

std::optional<RemoteStatus> parseRemoteStatus(const std::string& name) {
  if (name == "Accepted")   return RemoteStatus::Accepted;
  if (name == "Processing") return RemoteStatus::Processing;
  if (name == "Completed")  return RemoteStatus::Completed;
  if (name == "Cancelled")  return RemoteStatus::Cancelled;
  if (name == "Rejected")   return RemoteStatus::Rejected;
  return std::nullopt;
}

}  // namespace osr
