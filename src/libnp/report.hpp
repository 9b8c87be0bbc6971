#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "log.hpp"
#include "types.hpp"

// Receives the complete batch of one transport run.
class ProbeReportSink {
 public:
  virtual ~ProbeReportSink() = default;
  virtual void on_batch_complete(TransportKind transport,
                                 const ProbeBatch& batch) = 0;
};

struct ProbeSummary {
  size_t attempted{};
  size_t succeeded{};
  // Round trip statistics over successful probes only, in milliseconds.
  std::optional<double> min_ms;
  std::optional<double> avg_ms;
  std::optional<double> max_ms;
};

ProbeSummary summarize(const ProbeBatch& batch);

// "<queried>  resolved=<addr|none>  mapped=<addr|none>  rtt=<ms|none>"
// followed by "  error=<reason>" for failed probes.
std::string format_outcome_line(const ProbeOutcome& outcome);

std::string format_summary_line(TransportKind transport,
                                 const ProbeSummary& summary);

// Summary line followed by one line per outcome, in batch order. Nothing is
// filtered out.
std::vector<std::string> format_report(TransportKind transport,
                                       const ProbeBatch& batch);

// Writes the report through logger, scoped per transport.
std::unique_ptr<ProbeReportSink> make_log_report_sink(Logger logger);
