#include <asio.hpp>
#include "log.hpp"
#include "stun.hpp"
#include "transport.hpp"

LOG_MODULE_NAME("UDP");

using asio::ip::udp;

namespace {
std::string to_numeric_string(const udp::endpoint& ep) {
  return MappedAddress{ep.address(), ep.port()}.to_string();
}

class UDP_Channel : public ProbeChannel {
 public:
  UDP_Channel(asio::io_context& ctx,
              udp::socket& socket,
              udp::endpoint destination,
              std::optional<Clock::time_point> deadline)
      : m_ctx(ctx),
        m_socket(socket),
        m_destination(destination),
        m_deadline(deadline) {}

  std::string remote_address() const override {
    return to_numeric_string(m_destination);
  }

  expected<size_t> send(std::span<const uint8_t> data) override {
    // The deadline covers writes as well. A run that already used up its time
    // budget fails here without touching the network.
    if (m_deadline && Clock::now() >= *m_deadline) {
      return unexpected(make_error_code(probe_errc::deadline_exceeded));
    }

    std::error_code ec;
    const size_t n = m_socket.send_to(asio::buffer(data.data(), data.size()),
                                      m_destination, 0, ec);
    if (ec) {
      LOG_DEBUG("send_to {} failed: {}", to_numeric_string(m_destination),
                ec.message());
      return unexpected(make_error_code(probe_errc::write_failed));
    }
    return n;
  }

  expected<size_t> receive(std::span<uint8_t> buffer) override {
    std::error_code result_ec;
    size_t received = 0;
    udp::endpoint source;

    m_socket.async_receive_from(
        asio::buffer(buffer.data(), buffer.size()), source,
        [&](std::error_code ec, size_t n) {
          result_ec = ec;
          received = n;
        });

    const bool timed_out =
        run_with_deadline(m_ctx, m_deadline, [this] { cancel(); });

    if (result_ec) {
      if (timed_out && result_ec == asio::error::operation_aborted) {
        return unexpected(make_error_code(probe_errc::deadline_exceeded));
      }
      LOG_DEBUG("receive_from failed: {}", result_ec.message());
      return unexpected(make_error_code(probe_errc::read_failed));
    }

    // Any datagram arriving on the socket is taken, like a plain ReadFrom.
    // Correlation is left to the transaction ID check.
    if (source != m_destination) {
      LOG_WARNING("Received {} bytes from {} while waiting for {}", received,
                  to_numeric_string(source),
                  to_numeric_string(m_destination));
    }
    return received;
  }

 private:
  void cancel() {
    std::error_code ec;
    m_socket.cancel(ec);
    if (ec) {
      LOG_WARNING("Failed cancelling pending receive: {}", ec.message());
    }
  }

  asio::io_context& m_ctx;
  udp::socket& m_socket;
  udp::endpoint m_destination;
  std::optional<Clock::time_point> m_deadline;
};

class UDP_TransportImpl : public ProbeTransport {
 public:
  UDP_TransportImpl(asio::io_context& ctx, TransportOptions options)
      : m_ctx(ctx), m_options(std::move(options)), m_socket(ctx) {}

  ~UDP_TransportImpl() override {
    if (!m_socket.is_open())
      return;
    std::error_code ec;
    m_socket.close(ec);
    if (ec) {
      LOG_WARNING("Failed closing UDP socket: {}", ec.message());
    }
  }

  std::error_code initialize() {
    std::error_code ec;
    const auto local_address =
        asio::ip::make_address(m_options.local_address, ec);
    if (ec) {
      LOG_ERROR("Invalid local address '{}': {}", m_options.local_address,
                ec.message());
      return probe_errc::transport_unavailable;
    }

    m_socket.open(local_address.is_v6() ? udp::v6() : udp::v4(), ec);
    if (ec) {
      LOG_ERROR("Failed opening UDP socket: {}", ec.message());
      return probe_errc::transport_unavailable;
    }

    m_socket.bind(udp::endpoint(local_address, 0), ec);
    if (ec) {
      LOG_ERROR("Failed binding UDP socket: {}", ec.message());
      return probe_errc::transport_unavailable;
    }

    LOG_DEBUG("bound to {}", to_numeric_string(m_socket.local_endpoint(ec)));

    return apply_deadline(m_options.timeout);
  }

  // One deadline for every server of the run, never renewed.
  std::error_code apply_deadline(Clock::duration timeout) {
    if (!m_socket.is_open()) {
      return probe_errc::deadline_setup_failed;
    }
    m_deadline = deadline_after(timeout);
    return {};
  }

  TransportKind kind() const override { return TransportKind::udp; }

  expected<std::unique_ptr<ProbeChannel>> connect(
      const ServerEndpoint& endpoint) override {
    auto host_port = split_host_port(endpoint);
    if (!host_port) {
      return unexpected(host_port.error());
    }

    std::error_code ec;
    const auto protocol = m_socket.local_endpoint(ec).protocol();
    if (ec) {
      LOG_ERROR("UDP socket has no local endpoint: {}", ec.message());
      return unexpected(make_error_code(probe_errc::resolution_failed));
    }

    udp::resolver resolver{m_ctx};
    auto results =
        resolver.resolve(protocol, host_port->first, host_port->second, ec);
    if (ec || results.empty()) {
      LOG_DEBUG("resolving {} failed: {}", endpoint, ec.message());
      return unexpected(make_error_code(probe_errc::resolution_failed));
    }

    std::unique_ptr<ProbeChannel> channel = std::make_unique<UDP_Channel>(
        m_ctx, m_socket, results.begin()->endpoint(), m_deadline);
    return channel;
  }

 private:
  asio::io_context& m_ctx;
  TransportOptions m_options;
  udp::socket m_socket;
  std::optional<Clock::time_point> m_deadline;
};
}  // namespace

expected<std::unique_ptr<ProbeTransport>> make_udp_transport(
    asio::io_context& ctx,
    TransportOptions options) {
  auto instance = std::make_unique<UDP_TransportImpl>(ctx, std::move(options));
  if (auto ec = instance->initialize(); ec) {
    LOG_ERROR("Failed initializing UDP transport: {}", ec.message());
    return unexpected(ec);
  }
  std::unique_ptr<ProbeTransport> transport = std::move(instance);
  return transport;
}
