#include "types.hpp"

#include <ostream>

std::string to_string(TransportKind v) {
  switch (v) {
    case TransportKind::udp:
      return "udp";
    case TransportKind::tcp:
      return "tcp";
    default:
      return "unknown";
  }
}

std::ostream& operator<<(std::ostream& os, TransportKind v) {
  os << to_string(v);
  return os;
}

std::ostream& operator<<(std::ostream& os, const ProbeOutcome& o) {
  os << "ProbeOutcome{queried_endpoint: " << o.queried_endpoint
     << ", resolved_address: " << o.resolved_address.value_or("<none>")
     << ", mapped_address: " << o.mapped_address.value_or("<none>");
  if (o.round_trip) {
    os << ", round_trip_us: "
       << std::chrono::duration_cast<std::chrono::microseconds>(*o.round_trip)
              .count();
  }
  if (o.failure) {
    os << ", failure: " << o.failure.message();
  }
  os << "}";
  return os;
}
