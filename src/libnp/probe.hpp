#pragma once

#include <asio/io_context.hpp>
#include <span>
#include <system_error>

#include "config.hpp"
#include "defs.hpp"
#include "log.hpp"
#include "report.hpp"
#include "transport.hpp"
#include "types.hpp"

// Comfortably larger than any STUN message a server sends back.
constexpr size_t StunResponseBufferSize = 2000;

// Sends one binding request (serialized once, same transaction ID for every
// server) to each server in order and validates the replies. A failing server
// is logged and skipped, so the batch always has one outcome per server in
// the order given. Fails only if the request itself cannot be built.
expected<ProbeBatch> probe_servers(ProbeTransport& transport,
                                   std::span<const ServerEndpoint> servers,
                                   const Logger& logger);

// Opens the transport of the given kind, probes servers and hands the batch
// to sink. The returned error means the transport could not be set up and
// nothing was probed.
std::error_code run_probe(asio::io_context& ctx,
                          TransportKind kind,
                          std::span<const ServerEndpoint> servers,
                          const TransportOptions& options,
                          const Logger& logger,
                          ProbeReportSink& sink);

std::error_code run_udp_probe(asio::io_context& ctx,
                              const ProbeConfig& config,
                              const Logger& logger,
                              ProbeReportSink& sink);

std::error_code run_tcp_probe(asio::io_context& ctx,
                              const ProbeConfig& config,
                              const Logger& logger,
                              ProbeReportSink& sink);
