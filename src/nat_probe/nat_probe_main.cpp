#include <asio/io_context.hpp>
#include <iostream>

#include "config.hpp"
#include "log.hpp"
#include "probe.hpp"
#include "report.hpp"

LOG_MODULE_NAME("NAT_PROBE");

int main(int argc, char* argv[]) {
  auto config = parse_command_line(argc, argv);
  if (!config) {
    std::cerr << "ERROR: invalid arguments.\n" << usage_text(argv[0]);
    return 2;
  }
  if (config->show_help) {
    std::cout << usage_text(argv[0]);
    return 0;
  }

  set_log_level(config->log_level);

  Logger logger{"nat-probe"};
  auto sink = make_log_report_sink(logger);
  asio::io_context ctx;

  // UDP first, then TCP. Failing to even set up a transport is fatal, a
  // single unreachable server is not.
  if (!config->udp_servers.empty()) {
    if (auto ec = run_udp_probe(ctx, *config, logger, *sink); ec) {
      LOG_ERROR("UDP probe failed: {}", ec.message());
      return 1;
    }
  } else {
    LOG_INFO("UDP probe skipped");
  }

  if (!config->tcp_servers.empty()) {
    if (auto ec = run_tcp_probe(ctx, *config, logger, *sink); ec) {
      LOG_ERROR("TCP probe failed: {}", ec.message());
      return 1;
    }
  } else {
    LOG_INFO("TCP probe skipped");
  }

  return 0;
}
