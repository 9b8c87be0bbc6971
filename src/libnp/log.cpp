#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace np_log_details {
namespace {
std::mutex g_lock;
LogSink g_sink;
std::atomic<LogLevel> g_min_level{LogLevel::info};

const char* label(LogLevel level) {
  switch (level) {
    case LogLevel::debug:
      return "  DEBUG";
    case LogLevel::info:
      return "   INFO";
    case LogLevel::warning:
      return "WARNING";
    case LogLevel::error:
      return "  ERROR";
    default:
      return "LogLevel::<unknown>";
  }
}
}  // namespace

const std::string& get_module(const ModuleNameDefaultTag&) {
  static const std::string no_module;
  return no_module;
}

bool enabled(LogLevel level) {
  return level >= g_min_level.load(std::memory_order_relaxed);
}

void write_line(LogLevel level,
                std::string_view module_,
                std::string_view message) {
  auto line = std::format("{}: {:>{}}{}", label(level), module_,
                          MODULE_WIDTH, message);
  LogSink sink;
  {
    std::lock_guard lck{g_lock};
    if (!g_sink) {
      std::cout << line << "\n";
      return;
    }
    sink = g_sink;
  }
  sink(level, line);
}

}  // namespace np_log_details

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug:
      return "debug";
    case LogLevel::info:
      return "info";
    case LogLevel::warning:
      return "warning";
    case LogLevel::error:
      return "error";
    default:
      return "unknown";
  }
}

void set_log_level(LogLevel level) {
  np_log_details::g_min_level.store(level, std::memory_order_relaxed);
}

np_log_details::LogSink set_log_sink(np_log_details::LogSink sink) {
  std::lock_guard lck{np_log_details::g_lock};
  std::swap(np_log_details::g_sink, sink);
  return sink;
}

Logger::Logger(std::string name)
    : m_name(std::move(name)), m_module(m_name + ": ") {}

Logger Logger::sublogger(std::string_view name) const {
  Logger child{std::format("{}.{}", m_name, name)};
  child.m_fields = m_fields;
  return child;
}

Logger Logger::with_field(std::string_view key, std::string value) const {
  Logger copy{*this};
  copy.m_fields.emplace_back(std::string{key}, std::move(value));
  return copy;
}

std::string Logger::decorate(std::string message) const {
  if (m_fields.empty())
    return message;

  message += " {";
  bool first = true;
  for (const auto& [key, value] : m_fields) {
    if (!first)
      message += ", ";
    first = false;
    message += key;
    message += '=';
    message += value;
  }
  message += '}';
  return message;
}
