#include <asio.hpp>
#include "log.hpp"
#include "stun.hpp"
#include "transport.hpp"

LOG_MODULE_NAME("TCP");

using asio::ip::tcp;

namespace {
std::string to_numeric_string(const tcp::endpoint& ep) {
  return MappedAddress{ep.address(), ep.port()}.to_string();
}

// Owns one connection. Closed when the probe iteration drops it.
class TCP_Channel : public ProbeChannel {
 public:
  TCP_Channel(asio::io_context& ctx, tcp::socket socket, tcp::endpoint peer)
      : m_ctx(ctx), m_socket(std::move(socket)), m_peer(peer) {}

  ~TCP_Channel() override {
    std::error_code ec;
    m_socket.shutdown(tcp::socket::shutdown_both, ec);
    if (ec) {
      LOG_DEBUG("shutdown of connection to {}: {}", to_numeric_string(m_peer),
                ec.message());
    }
    m_socket.close(ec);
    if (ec) {
      LOG_WARNING("Failed closing connection to {}: {}",
                  to_numeric_string(m_peer), ec.message());
    }
  }

  std::error_code apply_read_deadline(Clock::duration timeout) {
    if (!m_socket.is_open()) {
      return probe_errc::deadline_setup_failed;
    }
    m_read_deadline = deadline_after(timeout);
    return {};
  }

  std::string remote_address() const override {
    return to_numeric_string(m_peer);
  }

  expected<size_t> send(std::span<const uint8_t> data) override {
    std::error_code ec;
    const size_t n =
        m_socket.write_some(asio::buffer(data.data(), data.size()), ec);
    if (ec) {
      LOG_DEBUG("write to {} failed: {}", to_numeric_string(m_peer),
                ec.message());
      return unexpected(make_error_code(probe_errc::write_failed));
    }
    return n;
  }

  expected<size_t> receive(std::span<uint8_t> buffer) override {
    std::error_code result_ec;
    size_t received = 0;

    m_socket.async_read_some(asio::buffer(buffer.data(), buffer.size()),
                             [&](std::error_code ec, size_t n) {
                               result_ec = ec;
                               received = n;
                             });

    const bool timed_out =
        run_with_deadline(m_ctx, m_read_deadline, [this] { cancel(); });

    if (result_ec) {
      if (timed_out && result_ec == asio::error::operation_aborted) {
        return unexpected(make_error_code(probe_errc::deadline_exceeded));
      }
      LOG_DEBUG("read from {} failed: {}", to_numeric_string(m_peer),
                result_ec.message());
      return unexpected(make_error_code(probe_errc::read_failed));
    }
    return received;
  }

 private:
  void cancel() {
    std::error_code ec;
    m_socket.cancel(ec);
    if (ec) {
      LOG_WARNING("Failed cancelling pending read: {}", ec.message());
    }
  }

  asio::io_context& m_ctx;
  tcp::socket m_socket;
  tcp::endpoint m_peer;
  std::optional<Clock::time_point> m_read_deadline;
};

class TCP_TransportImpl : public ProbeTransport {
 public:
  TCP_TransportImpl(asio::io_context& ctx, TransportOptions options)
      : m_ctx(ctx), m_options(std::move(options)) {}

  std::error_code initialize() {
    std::error_code ec;
    m_local_address = asio::ip::make_address(m_options.local_address, ec);
    if (ec) {
      LOG_ERROR("Invalid local address '{}': {}", m_options.local_address,
                ec.message());
      return probe_errc::transport_unavailable;
    }
    return {};
  }

  TransportKind kind() const override { return TransportKind::tcp; }

  // Unlike UDP, every server gets its own connection, all dialed from the
  // same local address so their outbound behavior is comparable.
  expected<std::unique_ptr<ProbeChannel>> connect(
      const ServerEndpoint& endpoint) override {
    auto host_port = split_host_port(endpoint);
    if (!host_port) {
      return unexpected(host_port.error());
    }

    const auto protocol = m_local_address.is_v6() ? tcp::v6() : tcp::v4();

    std::error_code ec;
    tcp::resolver resolver{m_ctx};
    auto results =
        resolver.resolve(protocol, host_port->first, host_port->second, ec);
    if (ec || results.empty()) {
      LOG_DEBUG("resolving {} failed: {}", endpoint, ec.message());
      return unexpected(make_error_code(probe_errc::resolution_failed));
    }

    // Dial deadline covers all resolved addresses together.
    const auto dial_deadline = deadline_after(m_options.timeout);
    for (const auto& entry : results) {
      auto socket = dial(entry.endpoint(), dial_deadline);
      if (!socket) {
        continue;
      }

      auto channel = std::make_unique<TCP_Channel>(m_ctx, std::move(*socket),
                                                   entry.endpoint());
      if (auto dec = channel->apply_read_deadline(m_options.timeout); dec) {
        LOG_DEBUG("setting read deadline for {} failed: {}", endpoint,
                  dec.message());
        return unexpected(dec);
      }
      std::unique_ptr<ProbeChannel> result = std::move(channel);
      return result;
    }

    return unexpected(make_error_code(probe_errc::connect_failed));
  }

 private:
  std::optional<tcp::socket> dial(const tcp::endpoint& peer,
                                  std::optional<Clock::time_point> deadline) {
    tcp::socket socket{m_ctx};
    std::error_code ec;

    socket.open(peer.protocol(), ec);
    if (ec) {
      LOG_WARNING("Failed opening TCP socket: {}", ec.message());
      return std::nullopt;
    }
    socket.bind(tcp::endpoint(m_local_address, 0), ec);
    if (ec) {
      LOG_WARNING("Failed binding TCP socket to {}: {}",
                  m_options.local_address, ec.message());
      return std::nullopt;
    }

    std::error_code connect_ec;
    socket.async_connect(peer,
                         [&connect_ec](std::error_code e) { connect_ec = e; });

    const bool timed_out = run_with_deadline(m_ctx, deadline, [&socket] {
      std::error_code cancel_ec;
      socket.cancel(cancel_ec);
      if (cancel_ec) {
        LOG_WARNING("Failed cancelling pending connect: {}",
                    cancel_ec.message());
      }
    });

    if (connect_ec) {
      if (timed_out && connect_ec == asio::error::operation_aborted) {
        LOG_DEBUG("connecting to {} timed out", to_numeric_string(peer));
      } else {
        LOG_DEBUG("connecting to {} failed: {}", to_numeric_string(peer),
                  connect_ec.message());
      }
      socket.close(ec);
      return std::nullopt;
    }

    LOG_DEBUG("connected {} -> {}",
              to_numeric_string(socket.local_endpoint(ec)),
              to_numeric_string(peer));
    return socket;
  }

  asio::io_context& m_ctx;
  TransportOptions m_options;
  asio::ip::address m_local_address;
};
}  // namespace

expected<std::unique_ptr<ProbeTransport>> make_tcp_transport(
    asio::io_context& ctx,
    TransportOptions options) {
  auto instance = std::make_unique<TCP_TransportImpl>(ctx, std::move(options));
  if (auto ec = instance->initialize(); ec) {
    LOG_ERROR("Failed initializing TCP transport: {}", ec.message());
    return unexpected(ec);
  }
  std::unique_ptr<ProbeTransport> transport = std::move(instance);
  return transport;
}
