#include "probe.hpp"
#include "stun.hpp"

#include <vector>

LOG_MODULE_NAME("PROBE");

namespace {
struct BindingRequest {
  StunMessage message;
  std::vector<uint8_t> raw;
};

expected<BindingRequest> build_binding_request() {
  BindingRequest request{.message = make_binding_request()};
  auto raw = serialize_stun_message(request.message);
  if (!raw) {
    return unexpected(raw.error());
  }
  request.raw = std::move(*raw);
  return request;
}

// Transports report probe_errc values. Anything else is folded into fallback.
std::error_code as_probe_error(std::error_code ec, probe_errc fallback) {
  if (ec.category() == probe_category())
    return ec;
  return fallback;
}

std::error_code fail(const Logger& logger,
                     std::error_code code,
                     std::error_code cause,
                     std::string_view message) {
  logger.with_field("error", cause.message()).warning("{}", message);
  return code;
}

std::string_view connect_failure_message(TransportKind kind,
                                         std::error_code ec) {
  if (ec == probe_errc::resolution_failed) {
    return kind == TransportKind::udp ? "Error resolving URL to a UDP address"
                                      : "Error resolving URL to a TCP address";
  }
  if (ec == probe_errc::deadline_setup_failed) {
    return "Error setting read deadline on TCP connection";
  }
  return "Error dialing STUN server via TCP";
}

// Walks the exchange resolve -> send -> receive -> decode -> classify ->
// extract -> verify. outcome keeps whatever was learned before a failure.
std::error_code probe_one(ProbeTransport& transport,
                          const BindingRequest& request,
                          ProbeOutcome& outcome,
                          const Logger& logger) {
  auto channel = transport.connect(outcome.queried_endpoint);
  if (!channel) {
    const auto code =
        as_probe_error(channel.error(), probe_errc::connect_failed);
    return fail(logger, code, channel.error(),
                connect_failure_message(transport.kind(), code));
  }
  outcome.resolved_address = (*channel)->remote_address();

  const auto bind_start = Clock::now();
  auto written = (*channel)->send(request.raw);
  if (!written) {
    return fail(logger,
                as_probe_error(written.error(), probe_errc::write_failed),
                written.error(),
                "Error writing to conn");
  }
  if (*written != request.raw.size()) {
    logger.warning("Only wrote {}/{} of bind request", *written,
                   request.raw.size());
    return probe_errc::short_write;
  }

  std::vector<uint8_t> raw_response(StunResponseBufferSize);
  auto received = (*channel)->receive(raw_response);
  if (!received) {
    return fail(logger,
                as_probe_error(received.error(), probe_errc::read_failed),
                received.error(), "Error reading from conn");
  }

  auto response = deserialize_stun_message_from(
      std::span<const uint8_t>{raw_response}.first(*received));
  if (!response) {
    return fail(logger, probe_errc::decode_failed, response.error(),
                "Error decoding STUN message");
  }

  if (response->msg_class != StunClass::success_response) {
    logger.with_field("response_type", to_string(response->msg_class))
        .warning("Unexpected STUN response received");
    return probe_errc::unexpected_response_class;
  }

  auto mapped = extract_xor_mapped_address(*response);
  if (!mapped) {
    return fail(logger, probe_errc::address_extraction_failed, mapped.error(),
                "Error extracting address from STUN message");
  }

  if (response->transaction_id != request.message.transaction_id) {
    logger.warning("Transaction ID mismatch (expected {}, got {})",
                   to_hex(request.message.transaction_id),
                   to_hex(response->transaction_id));
    return probe_errc::transaction_mismatch;
  }

  outcome.mapped_address = mapped->to_string();
  outcome.round_trip = Clock::now() - bind_start;
  return {};
}
}  // namespace

expected<ProbeBatch> probe_servers(ProbeTransport& transport,
                                   std::span<const ServerEndpoint> servers,
                                   const Logger& logger) {
  auto request = build_binding_request();
  if (!request) {
    logger.with_field("error", request.error().message())
        .error("Failed building STUN binding request");
    return unexpected(request.error());
  }
  LOG_DEBUG("binding request {} for {} server(s) over {}",
            to_hex(request->message.transaction_id), servers.size(),
            to_string(transport.kind()));

  ProbeBatch batch;
  batch.reserve(servers.size());
  for (const auto& server : servers) {
    const auto server_logger = logger.with_field("stun_server_url", server);

    ProbeOutcome& outcome = batch.emplace_back();
    outcome.queried_endpoint = server;
    outcome.failure = probe_one(transport, *request, outcome, server_logger);
  }
  return batch;
}

std::error_code run_probe(asio::io_context& ctx,
                          TransportKind kind,
                          std::span<const ServerEndpoint> servers,
                          const TransportOptions& options,
                          const Logger& logger,
                          ProbeReportSink& sink) {
  const auto transport_logger = logger.sublogger(to_string(kind));

  auto transport = kind == TransportKind::udp
                       ? make_udp_transport(ctx, options)
                       : make_tcp_transport(ctx, options);
  if (!transport) {
    transport_logger.with_field("error", transport.error().message())
        .error(kind == TransportKind::udp
                   ? "Failed to listen over UDP on a port; UDP traffic may "
                     "be blocked"
                   : "Failed to set up TCP dialer");
    return transport.error();
  }

  auto batch = probe_servers(**transport, servers, transport_logger);
  if (!batch) {
    return batch.error();
  }

  sink.on_batch_complete(kind, *batch);
  return {};
}

std::error_code run_udp_probe(asio::io_context& ctx,
                              const ProbeConfig& config,
                              const Logger& logger,
                              ProbeReportSink& sink) {
  return run_probe(ctx, TransportKind::udp, config.udp_servers,
                   config.transport_options(), logger, sink);
}

std::error_code run_tcp_probe(asio::io_context& ctx,
                              const ProbeConfig& config,
                              const Logger& logger,
                              ProbeReportSink& sink) {
  return run_probe(ctx, TransportKind::tcp, config.tcp_servers,
                   config.transport_options(), logger, sink);
}
