#include "config.hpp"

#include <charconv>
#include <cmath>
#include <format>
#include <string_view>

LOG_MODULE_NAME("CONFIG");

using namespace std::string_view_literals;

namespace {
constexpr std::chrono::seconds MaxTimeout = std::chrono::hours(24 * 365);

expected<Clock::duration> parse_seconds(std::string_view value) {
  double seconds{};
  const auto* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, seconds);
  if (ec != std::errc{} || ptr != end || !std::isfinite(seconds) ||
      seconds < 0) {
    LOG_ERROR("Invalid timeout '{}', expected non-negative seconds", value);
    return unexpected(make_error_code(std::errc::invalid_argument));
  }
  // Bounded so that now + timeout still fits into a steady_clock time point.
  if (std::chrono::duration<double>(seconds) > MaxTimeout) {
    LOG_ERROR("Timeout '{}' exceeds {} seconds", value, MaxTimeout.count());
    return unexpected(make_error_code(std::errc::invalid_argument));
  }
  return std::chrono::duration_cast<Clock::duration>(
      std::chrono::duration<double>(seconds));
}
}  // namespace

TransportOptions ProbeConfig::transport_options() const {
  return TransportOptions{.local_address = local_address, .timeout = timeout};
}

ProbeConfig default_probe_config() {
  ProbeConfig config;
  config.udp_servers = {
      "stun.l.google.com:3478",      "stun.l.google.com:19302",
      "stun.sipgate.net:3478",       "stun.sipgate.net:3479",
      "global.stun.twilio.com:3478", "turn.viam.com:443",
  };
  config.tcp_servers = {
      "turn.viam.com:443",
  };
  return config;
}

expected<ProbeConfig> parse_command_line(int argc, const char* const* argv) {
  ProbeConfig config = default_probe_config();
  bool udp_overridden = false;
  bool tcp_overridden = false;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    auto next_value = [&]() -> expected<std::string_view> {
      if (i + 1 >= argc) {
        LOG_ERROR("Option {} requires a value", a);
        return unexpected(make_error_code(std::errc::invalid_argument));
      }
      return std::string_view{argv[++i]};
    };

    if (a == "-h"sv || a == "--help"sv) {
      config.show_help = true;
    } else if (a == "--debug"sv) {
      config.log_level = LogLevel::debug;
    } else if (a == "--no-udp"sv) {
      config.udp_servers.clear();
      udp_overridden = true;
    } else if (a == "--no-tcp"sv) {
      config.tcp_servers.clear();
      tcp_overridden = true;
    } else if (a == "--timeout"sv) {
      auto value = next_value();
      if (!value)
        return unexpected(value.error());
      auto timeout = parse_seconds(*value);
      if (!timeout)
        return unexpected(timeout.error());
      config.timeout = *timeout;
    } else if (a == "--udp"sv || a == "--tcp"sv) {
      auto value = next_value();
      if (!value)
        return unexpected(value.error());
      if (auto hp = split_host_port(*value); !hp) {
        LOG_ERROR("Invalid server '{}', expected HOST:PORT", *value);
        return unexpected(make_error_code(std::errc::invalid_argument));
      }
      const bool udp = a == "--udp"sv;
      auto& servers = udp ? config.udp_servers : config.tcp_servers;
      auto& overridden = udp ? udp_overridden : tcp_overridden;
      if (!overridden) {
        servers.clear();
        overridden = true;
      }
      servers.emplace_back(*value);
    } else if (a == "--local-address"sv) {
      auto value = next_value();
      if (!value)
        return unexpected(value.error());
      config.local_address = std::string{*value};
    } else {
      LOG_ERROR("Unknown argument: {}", a);
      return unexpected(make_error_code(std::errc::invalid_argument));
    }
  }

  return config;
}

std::string usage_text(const char* prog) {
  std::string out;
  out += "STUN reachability probe over UDP and TCP\n";
  out += std::format("Usage: {} [options]\n", prog);
  out += "Options:\n";
  out += "  --timeout SECONDS     Deadline, whole UDP run / each TCP server "
         "(default: 10, 0 disables)\n";
  out += "  --udp HOST:PORT       STUN server to probe over UDP (repeatable)\n";
  out += "  --tcp HOST:PORT       STUN server to probe over TCP (repeatable)\n";
  out += "  --no-udp              Skip the UDP probe\n";
  out += "  --no-tcp              Skip the TCP probe\n";
  out += "  --local-address IP    Local address to bind/dial from "
         "(default: 0.0.0.0)\n";
  out += "  --debug               Enable debug logging\n";
  out += "  -h, --help            Show this help\n";
  return out;
}
