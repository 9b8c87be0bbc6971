#pragma once

#include <asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "defs.hpp"
#include "types.hpp"

using Clock = std::chrono::steady_clock;

// Open path to one STUN server. Releases whatever it owns on destruction.
class ProbeChannel {
 public:
  virtual ~ProbeChannel() = default;

  // Numeric address of the server, e.g. 74.125.250.129:19302.
  virtual std::string remote_address() const = 0;

  // Returns number of bytes written, which may be less than data.size().
  virtual expected<size_t> send(std::span<const uint8_t> data) = 0;

  // Single read. Errors: probe_errc::read_failed, probe_errc::deadline_exceeded.
  virtual expected<size_t> receive(std::span<uint8_t> buffer) = 0;
};

// Hands out channels for one transport run. An error from connect() concerns
// only that server.
class ProbeTransport {
 public:
  virtual ~ProbeTransport() = default;

  virtual TransportKind kind() const = 0;

  // Errors: probe_errc::resolution_failed, probe_errc::connect_failed,
  // probe_errc::deadline_setup_failed.
  virtual expected<std::unique_ptr<ProbeChannel>> connect(
      const ServerEndpoint& endpoint) = 0;
};

struct TransportOptions {
  std::string local_address = "0.0.0.0";
  // Zero disables deadlines, blocking reads may then wait forever.
  Clock::duration timeout{};
};

// Binds one UDP socket on an arbitrary port of options.local_address. Every
// channel shares it. A single deadline now + timeout is armed here and covers
// all I/O of the run.
// Errors: probe_errc::transport_unavailable, probe_errc::deadline_setup_failed.
expected<std::unique_ptr<ProbeTransport>> make_udp_transport(
    asio::io_context& ctx,
    TransportOptions options);

// Each connect() dials a new connection bound to options.local_address (port
// picked by the OS), with dialing bounded by the timeout, and then arms a read
// deadline now + timeout on it.
// Errors: probe_errc::transport_unavailable.
expected<std::unique_ptr<ProbeTransport>> make_tcp_transport(
    asio::io_context& ctx,
    TransportOptions options);

// "host:port" or "[v6-literal]:port" into host and port.
expected<std::pair<std::string, std::string>> split_host_port(
    std::string_view endpoint);

// now + timeout, or nullopt when timeout is zero (deadline disabled).
std::optional<Clock::time_point> deadline_after(Clock::duration timeout);

// Runs ctx until its pending operations complete. With a deadline, stops at
// the deadline, calls cancel and drains the aborted handlers. Returns true if
// the deadline was hit. ctx must not carry unrelated work.
bool run_with_deadline(asio::io_context& ctx,
                       std::optional<Clock::time_point> deadline,
                       const std::function<void()>& cancel);
