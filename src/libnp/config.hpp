#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "defs.hpp"
#include "log.hpp"
#include "transport.hpp"
#include "types.hpp"

struct ProbeConfig {
  std::vector<ServerEndpoint> udp_servers;
  std::vector<ServerEndpoint> tcp_servers;
  // Whole-run deadline for UDP, per-connection dial and read deadline for TCP.
  // Zero disables deadlines.
  Clock::duration timeout = std::chrono::seconds(10);
  std::string local_address = "0.0.0.0";
  LogLevel log_level = LogLevel::info;
  bool show_help = false;

  TransportOptions transport_options() const;
};

// Public STUN servers probed when nothing else is configured.
ProbeConfig default_probe_config();

// Applies command line overrides on top of default_probe_config():
//   --timeout SECONDS       fractional seconds, 0 disables deadlines
//   --udp HOST:PORT         repeatable, first use replaces the default list
//   --tcp HOST:PORT         same for TCP
//   --no-udp / --no-tcp     skip that transport
//   --local-address IP      address to bind and dial from
//   --debug                 debug logging
//   -h, --help
// Errors: std::errc::invalid_argument.
expected<ProbeConfig> parse_command_line(int argc, const char* const* argv);

std::string usage_text(const char* prog);
