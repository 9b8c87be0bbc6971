#include "report.hpp"

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace {
double to_ms(std::chrono::steady_clock::duration d) {
  return std::chrono::duration<double, std::milli>(d).count();
}

class LogReportSink : public ProbeReportSink {
 public:
  explicit LogReportSink(Logger logger) : m_logger(std::move(logger)) {}

  void on_batch_complete(TransportKind transport,
                         const ProbeBatch& batch) override {
    const auto logger = m_logger.sublogger(to_string(transport));
    for (const auto& line : format_report(transport, batch)) {
      logger.info("{}", line);
    }
  }

 private:
  Logger m_logger;
};
}  // namespace

ProbeSummary summarize(const ProbeBatch& batch) {
  ProbeSummary summary;
  summary.attempted = batch.size();

  std::vector<double> times;
  for (const auto& o : batch) {
    if (!o.succeeded())
      continue;
    ++summary.succeeded;
    if (o.round_trip)
      times.push_back(to_ms(*o.round_trip));
  }
  if (times.empty())
    return summary;

  auto [min_it, max_it] = std::minmax_element(times.begin(), times.end());
  summary.min_ms = *min_it;
  summary.max_ms = *max_it;
  summary.avg_ms = std::accumulate(times.begin(), times.end(), 0.0) /
                   static_cast<double>(times.size());
  return summary;
}

std::string format_outcome_line(const ProbeOutcome& outcome) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(3);
  os << outcome.queried_endpoint
     << "  resolved=" << outcome.resolved_address.value_or("<none>")
     << "  mapped=" << outcome.mapped_address.value_or("<none>") << "  rtt=";
  if (outcome.round_trip) {
    os << to_ms(*outcome.round_trip) << " ms";
  } else {
    os << "<none>";
  }
  if (outcome.failure) {
    os << "  error=" << outcome.failure.message();
  }
  return os.str();
}

std::string format_summary_line(TransportKind transport,
                                const ProbeSummary& summary) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(3);
  os << "STUN results over " << transport << ": " << summary.succeeded << "/"
     << summary.attempted << " server(s) responded";
  if (summary.min_ms) {
    os << " (rtt min=" << *summary.min_ms << " ms, avg=" << *summary.avg_ms
       << " ms, max=" << *summary.max_ms << " ms)";
  }
  return os.str();
}

std::vector<std::string> format_report(TransportKind transport,
                                       const ProbeBatch& batch) {
  std::vector<std::string> lines;
  lines.reserve(batch.size() + 1);
  lines.push_back(format_summary_line(transport, summarize(batch)));
  for (const auto& o : batch) {
    lines.push_back("  " + format_outcome_line(o));
  }
  return lines;
}

std::unique_ptr<ProbeReportSink> make_log_report_sink(Logger logger) {
  return std::make_unique<LogReportSink>(std::move(logger));
}
