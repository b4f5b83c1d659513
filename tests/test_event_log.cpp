#include "minitest.hpp"
#include "app/EventLog.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using svcdash::app::EventLog;

static std::filesystem::path tmp_dir(const char* suffix) {
  return std::filesystem::path("/tmp") / ("svcdash_test_events_" + std::to_string(::getpid()) + "_" + suffix);
}

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

TEST(event_log_writes_on_stop) {
  auto dir = tmp_dir("basic");
  auto path = dir / "nested" / "events.log";
  {
    EventLog log(path, std::chrono::milliseconds(10000));
    ASSERT_TRUE(log.enabled());
    ASSERT_TRUE(log.start());
    log.record("action", "start web: ok");
    log.record("refresh", "failed: boom");
    log.stop();
  }
  auto text = slurp(path);
  ASSERT_NE(text.find(" action: start web: ok\n"), std::string::npos);
  ASSERT_NE(text.find(" refresh: failed: boom\n"), std::string::npos);
  ASSERT_TRUE(text.find("action") < text.find("refresh"));
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

TEST(event_log_appends) {
  auto dir = tmp_dir("append");
  auto path = dir / "events.log";
  for (int i = 0; i < 2; ++i) {
    EventLog log(path);
    ASSERT_TRUE(log.start());
    log.record("run", std::to_string(i));
  }
  auto text = slurp(path);
  ASSERT_NE(text.find("run: 0\n"), std::string::npos);
  ASSERT_NE(text.find("run: 1\n"), std::string::npos);
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

TEST(event_log_disabled_is_noop) {
  EventLog log("");
  ASSERT_FALSE(log.enabled());
  ASSERT_FALSE(log.start());
  log.record("action", "ignored");
  log.stop();
}

TEST(event_log_unopenable_disables) {
  EventLog log("/proc/svcdash-cannot-create/events.log");
  ASSERT_FALSE(log.start());
  ASSERT_FALSE(log.enabled());
  log.record("action", "ignored");
}

TEST(event_log_timestamp_format) {
  auto s = svcdash::app::format_timestamp(std::chrono::system_clock::now());
  ASSERT_EQ(s.size(), 23u);
  ASSERT_EQ(s[4], '-');
  ASSERT_EQ(s[10], ' ');
  ASSERT_EQ(s[13], ':');
  ASSERT_EQ(s[19], '.');
}
