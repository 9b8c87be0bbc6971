#include "transport.hpp"
#include "log.hpp"

LOG_MODULE_NAME("TRANSPORT");

expected<std::pair<std::string, std::string>> split_host_port(
    std::string_view endpoint) {
  std::string_view host;
  std::string_view port;

  if (endpoint.starts_with('[')) {
    const auto close = endpoint.find(']');
    if (close == std::string_view::npos || close + 1 >= endpoint.size() ||
        endpoint[close + 1] != ':') {
      LOG_DEBUG("malformed bracketed endpoint: {}", endpoint);
      return unexpected(make_error_code(probe_errc::resolution_failed));
    }
    host = endpoint.substr(1, close - 1);
    port = endpoint.substr(close + 2);
  } else {
    const auto colon = endpoint.rfind(':');
    if (colon == std::string_view::npos) {
      LOG_DEBUG("endpoint has no port: {}", endpoint);
      return unexpected(make_error_code(probe_errc::resolution_failed));
    }
    host = endpoint.substr(0, colon);
    port = endpoint.substr(colon + 1);
    if (host.find(':') != std::string_view::npos) {
      LOG_DEBUG("IPv6 literal must be in brackets: {}", endpoint);
      return unexpected(make_error_code(probe_errc::resolution_failed));
    }
  }

  if (host.empty() || port.empty()) {
    LOG_DEBUG("empty host or port in endpoint: {}", endpoint);
    return unexpected(make_error_code(probe_errc::resolution_failed));
  }

  return std::pair{std::string{host}, std::string{port}};
}

std::optional<Clock::time_point> deadline_after(Clock::duration timeout) {
  if (timeout <= Clock::duration::zero())
    return std::nullopt;
  return Clock::now() + timeout;
}

bool run_with_deadline(asio::io_context& ctx,
                       std::optional<Clock::time_point> deadline,
                       const std::function<void()>& cancel) {
  ctx.restart();

  if (!deadline) {
    ctx.run();
    return false;
  }

  ctx.run_until(*deadline);
  if (ctx.stopped())
    return false;

  // Operation is still pending. The handler observes operation_aborted unless
  // it completed in the meantime.
  cancel();
  ctx.restart();
  ctx.run();
  return true;
}
