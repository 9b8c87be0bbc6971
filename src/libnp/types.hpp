#pragma once

#include <chrono>
#include <iosfwd>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

// host:port of a STUN server as it appears in configuration. IPv6 literals
// are written in brackets: [2001:db8::1]:3478.
using ServerEndpoint = std::string;

enum class TransportKind { udp, tcp };

std::string to_string(TransportKind v);
std::ostream& operator<<(std::ostream& os, TransportKind v);

// Result of probing one server. Fields are filled as the exchange
// progresses, so a failed probe keeps everything learned before the failure.
struct ProbeOutcome {
  ServerEndpoint queried_endpoint;
  // Numeric address actually contacted.
  std::optional<std::string> resolved_address;
  // Our address as seen by the server. Set only on a complete, validated
  // exchange.
  std::optional<std::string> mapped_address;
  std::optional<std::chrono::steady_clock::duration> round_trip;
  // Step that ended the probe, empty on success.
  std::error_code failure;

  bool succeeded() const { return mapped_address.has_value(); }
};

std::ostream& operator<<(std::ostream& os, const ProbeOutcome& o);

// One outcome per configured server, in configuration order.
using ProbeBatch = std::vector<ProbeOutcome>;
