#pragma once

#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace np_log_details {

enum class LogLevel { debug, info, warning, error };

constexpr auto MODULE_WIDTH = 10;

// Receives complete lines (label, module and message, no trailing newline).
using LogSink = std::function<void(LogLevel, std::string_view line)>;

class ModuleNameDefaultTag {};
class ModuleNameSpecificTag : public ModuleNameDefaultTag {};
const std::string& get_module(const ModuleNameDefaultTag&);
// Defines module name. Should be a valid C++ identifier as the name used in
// class name generation.
#define LOG_MODULE_NAME(Name)                                     \
  namespace {                                                     \
  const std::string& get_module(                                  \
      const np_log_details::ModuleNameSpecificTag& m) {           \
    static const std::string this_module_name{std::string{Name} + \
                                              std::string(": ")}; \
    return this_module_name;                                      \
  }                                                               \
  }

bool enabled(LogLevel level);
void write_line(LogLevel level,
                std::string_view module_,
                std::string_view message);

template <class... Args>
inline void print_log(LogLevel level,
                      const std::string& module_,
                      std::string_view fmt,
                      Args&&... args) {
  if (!enabled(level))
    return;
  write_line(level, module_,
             std::vformat(fmt, std::make_format_args(args...)));
}

}  // namespace np_log_details

using LogLevel = np_log_details::LogLevel;

std::string to_string(LogLevel level);

void set_log_level(LogLevel level);

// Replaces the destination of all log output and returns the previous sink.
// An empty sink restores the default (stdout). The sink runs outside the log
// lock, so it may log itself, but it has to serialize its own state if
// several threads log.
np_log_details::LogSink set_log_sink(np_log_details::LogSink sink);

// Contextual logger: dotted scope name plus key-value fields rendered after
// every message, e.g. "nat-probe.udp: Error reading {server=..., error=...}".
class Logger {
 public:
  explicit Logger(std::string name);

  Logger sublogger(std::string_view name) const;
  Logger with_field(std::string_view key, std::string value) const;

  const std::string& name() const { return m_name; }

  template <class... Args>
  void debug(std::string_view fmt, Args&&... args) const {
    log(LogLevel::debug, fmt, args...);
  }
  template <class... Args>
  void info(std::string_view fmt, Args&&... args) const {
    log(LogLevel::info, fmt, args...);
  }
  template <class... Args>
  void warning(std::string_view fmt, Args&&... args) const {
    log(LogLevel::warning, fmt, args...);
  }
  template <class... Args>
  void error(std::string_view fmt, Args&&... args) const {
    log(LogLevel::error, fmt, args...);
  }

  template <class... Args>
  void log(LogLevel level, std::string_view fmt, Args&&... args) const {
    if (!np_log_details::enabled(level))
      return;
    np_log_details::write_line(
        level, m_module,
        decorate(std::vformat(fmt, std::make_format_args(args...))));
  }

 private:
  std::string decorate(std::string message) const;

  std::string m_name;
  std::string m_module;
  std::vector<std::pair<std::string, std::string>> m_fields;
};

#define LOG_DEBUG(FmtMsg, ...)                                     \
  np_log_details::print_log(                                       \
      np_log_details::LogLevel::debug,                             \
      get_module(np_log_details::ModuleNameSpecificTag{}), FmtMsg, \
      ##__VA_ARGS__)
#define LOG_INFO(FmtMsg, ...)                                      \
  np_log_details::print_log(                                       \
      np_log_details::LogLevel::info,                              \
      get_module(np_log_details::ModuleNameSpecificTag{}), FmtMsg, \
      ##__VA_ARGS__)
#define LOG_WARNING(FmtMsg, ...)                                   \
  np_log_details::print_log(                                       \
      np_log_details::LogLevel::warning,                           \
      get_module(np_log_details::ModuleNameSpecificTag{}), FmtMsg, \
      ##__VA_ARGS__)
#define LOG_ERROR(FmtMsg, ...)                                     \
  np_log_details::print_log(                                       \
      np_log_details::LogLevel::error,                             \
      get_module(np_log_details::ModuleNameSpecificTag{}), FmtMsg, \
      ##__VA_ARGS__)
