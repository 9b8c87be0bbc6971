#include <gtest/gtest.h>

#include "log_capture.hpp"

LOG_MODULE_NAME("LOGTEST");

namespace {
// Restores the default level whatever the test does.
class LevelGuard {
 public:
  explicit LevelGuard(LogLevel level) { set_log_level(level); }
  ~LevelGuard() { set_log_level(LogLevel::info); }
};
}  // namespace

TEST(log_tests, module_macro_test) {
  LogCapture capture;
  LOG_INFO("value is {}", 42);

  ASSERT_EQ(capture.lines().size(), 1u);
  EXPECT_EQ(capture.lines()[0].first, LogLevel::info);
  EXPECT_EQ(capture.lines()[0].second, "   INFO:  LOGTEST: value is 42");
}

TEST(log_tests, sublogger_and_fields_test) {
  LogCapture capture;
  const Logger root{"nat-probe"};
  const auto udp = root.sublogger("udp");
  EXPECT_EQ(udp.name(), "nat-probe.udp");

  udp.with_field("stun_server_url", "stun.example.com:3478")
      .with_field("error", "timed out")
      .warning("Error reading from conn");
  udp.info("plain");

  ASSERT_EQ(capture.lines().size(), 2u);
  EXPECT_EQ(capture.lines()[0].first, LogLevel::warning);
  EXPECT_NE(capture.lines()[0].second.find(
                "nat-probe.udp: Error reading from conn "
                "{stun_server_url=stun.example.com:3478, error=timed out}"),
            std::string::npos)
      << capture.lines()[0].second;
  EXPECT_TRUE(capture.lines()[1].second.ends_with("nat-probe.udp: plain"));
}

TEST(log_tests, sublogger_keeps_parent_fields) {
  LogCapture capture;
  const auto scoped =
      Logger{"a"}.with_field("run", "1").sublogger("b").sublogger("c");
  EXPECT_EQ(scoped.name(), "a.b.c");

  scoped.error("boom");
  ASSERT_EQ(capture.lines().size(), 1u);
  EXPECT_TRUE(capture.lines()[0].second.ends_with("a.b.c: boom {run=1}"));
}

TEST(log_tests, level_filter_test) {
  LogCapture capture;
  {
    LevelGuard guard{LogLevel::warning};
    LOG_DEBUG("hidden debug");
    LOG_INFO("hidden info");
    Logger{"x"}.info("hidden info");
    LOG_WARNING("shown warning");
    Logger{"x"}.error("shown error");
  }
  LOG_DEBUG("hidden again");

  ASSERT_EQ(capture.lines().size(), 2u);
  EXPECT_TRUE(capture.contains(LogLevel::warning, "shown warning"));
  EXPECT_TRUE(capture.contains(LogLevel::error, "shown error"));

  {
    LevelGuard guard{LogLevel::debug};
    LOG_DEBUG("debug on");
  }
  EXPECT_TRUE(capture.contains(LogLevel::debug, "debug on"));
}

TEST(log_tests, sink_may_log_itself) {
  LogCapture capture;
  bool forwarding = false;
  np_log_details::LogSink inner;
  inner = set_log_sink([&](LogLevel level, std::string_view line) {
    inner(level, line);
    if (forwarding)
      return;
    forwarding = true;
    LOG_WARNING("seen: {}", line);
    forwarding = false;
  });

  LOG_INFO("outer");
  set_log_sink(std::move(inner));

  ASSERT_EQ(capture.lines().size(), 2u);
  EXPECT_TRUE(capture.contains(LogLevel::info, "outer"));
  EXPECT_TRUE(capture.contains(LogLevel::warning, "seen:    INFO:"));
}

TEST(log_tests, level_names_test) {
  EXPECT_EQ(to_string(LogLevel::debug), "debug");
  EXPECT_EQ(to_string(LogLevel::warning), "warning");
}
