#include <gtest/gtest.h>
#include <chrono>
#include <vector>

#include "config.hpp"

using namespace std::chrono_literals;

namespace {
expected<ProbeConfig> parse(std::vector<const char*> args) {
  args.insert(args.begin(), "nat_probe");
  return parse_command_line(static_cast<int>(args.size()), args.data());
}
}  // namespace

TEST(config_tests, defaults_test) {
  auto config = parse({});
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->timeout, 10s);
  EXPECT_EQ(config->local_address, "0.0.0.0");
  EXPECT_EQ(config->log_level, LogLevel::info);
  EXPECT_FALSE(config->show_help);

  const std::vector<ServerEndpoint> udp = {
      "stun.l.google.com:3478",      "stun.l.google.com:19302",
      "stun.sipgate.net:3478",       "stun.sipgate.net:3479",
      "global.stun.twilio.com:3478", "turn.viam.com:443",
  };
  EXPECT_EQ(config->udp_servers, udp);
  EXPECT_EQ(config->tcp_servers, std::vector<ServerEndpoint>{"turn.viam.com:443"});
}

TEST(config_tests, server_lists_are_replaced_by_first_override) {
  auto config = parse({"--udp", "a.example:3478", "--udp", "[2001:db8::1]:3478",
                       "--tcp", "b.example:443"});
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->udp_servers,
            (std::vector<ServerEndpoint>{"a.example:3478", "[2001:db8::1]:3478"}));
  EXPECT_EQ(config->tcp_servers, std::vector<ServerEndpoint>{"b.example:443"});
}

TEST(config_tests, transports_can_be_disabled) {
  auto config = parse({"--no-udp"});
  ASSERT_TRUE(config.has_value());
  EXPECT_TRUE(config->udp_servers.empty());
  EXPECT_FALSE(config->tcp_servers.empty());

  config = parse({"--no-tcp"});
  ASSERT_TRUE(config.has_value());
  EXPECT_FALSE(config->udp_servers.empty());
  EXPECT_TRUE(config->tcp_servers.empty());
}

TEST(config_tests, timeout_test) {
  auto config = parse({"--timeout", "2.5"});
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->timeout, 2500ms);

  config = parse({"--timeout", "31536000"});
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->timeout, 8760h);

  config = parse({"--timeout", "0"});
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->timeout, Clock::duration::zero());
  EXPECT_FALSE(config->transport_options().timeout > Clock::duration::zero());
}

TEST(config_tests, transport_options_test) {
  auto config =
      parse({"--local-address", "192.168.1.20", "--timeout", "3", "--debug"});
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->log_level, LogLevel::debug);

  const auto options = config->transport_options();
  EXPECT_EQ(options.local_address, "192.168.1.20");
  EXPECT_EQ(options.timeout, 3s);
}

TEST(config_tests, help_test) {
  auto config = parse({"-h"});
  ASSERT_TRUE(config.has_value());
  EXPECT_TRUE(config->show_help);

  const auto usage = usage_text("nat_probe");
  EXPECT_NE(usage.find("Usage: nat_probe"), std::string::npos);
  EXPECT_NE(usage.find("--timeout"), std::string::npos);
}

TEST(config_tests, invalid_arguments_test) {
  const std::vector<std::vector<const char*>> cases = {
      {"--timeout"},
      {"--timeout", "-1"},
      {"--timeout", "soon"},
      {"--timeout", "1s"},
      {"--timeout", "nan"},
      {"--timeout", "inf"},
      {"--timeout", "1e30"},
      {"--timeout", "31536001"},
      {"--udp", "no-port"},
      {"--tcp", "2001:db8::1:443"},
      {"--local-address"},
      {"--verbose"},
  };
  for (const auto& args : cases) {
    auto config = parse(args);
    ASSERT_FALSE(config.has_value()) << args.front();
    EXPECT_EQ(config.error(), std::errc::invalid_argument);
  }
}
