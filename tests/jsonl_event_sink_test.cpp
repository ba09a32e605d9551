// File: tests/jsonl_event_sink_test.cpp
#include <gtest/gtest.h>

#include "runbox/core/events/jsonl_event_sink.hpp"
#include "test_util.hpp"

namespace runbox {
namespace {

using test::read_text;
using test::TempDir;

TEST(JsonlEventSinkTest, WritesRunStartedThenEvents) {
  TempDir dir;
  JsonlEventSink sink((dir / "events").string());

  RunInfo run;
  run.run_id = "abc";
  run.config_hash = "0011223344556677";
  run.workspace = "/tmp/runs/abc";
  run.wall_start_ns = 1700000000000000000;
  ASSERT_TRUE(sink.open(run).ok());
  EXPECT_EQ(sink.path(), (dir / "events" / "events_abc.jsonl").string());

  Event e;
  e.type = "execution_finished";
  e.t_ns = 1500000000;
  e.t_wall_ns = 1700000001500000000;
  e.message = "said \"hi\"\n";
  e.fields = {{"exit_code", "0"}};
  ASSERT_TRUE(sink.emit(e).ok());
  ASSERT_TRUE(sink.flush().ok());
  sink.close();

  const std::string text = read_text(sink.path());
  const auto nl = text.find('\n');
  ASSERT_NE(nl, std::string::npos);
  const std::string first = text.substr(0, nl);
  const std::string second = text.substr(nl + 1);

  EXPECT_EQ(first.rfind("{\"type\":\"run_started\"", 0), 0u);
  EXPECT_NE(first.find("\"run_id\":\"abc\""), std::string::npos);
  EXPECT_NE(first.find("\"config_hash\":\"0011223344556677\""), std::string::npos);

  EXPECT_NE(second.find("\"type\":\"execution_finished\""), std::string::npos);
  EXPECT_NE(second.find("\"t_s\":1.500000"), std::string::npos);
  EXPECT_NE(second.find("\"message\":\"said \\\"hi\\\"\\n\""), std::string::npos);
  EXPECT_NE(second.find("\"exit_code\":\"0\""), std::string::npos);
  EXPECT_EQ(second.back(), '\n');
}

TEST(JsonlEventSinkTest, EmitBeforeOpenIsAnError) {
  TempDir dir;
  JsonlEventSink sink(dir.path().string());
  Event e;
  e.type = "x";
  EXPECT_FALSE(sink.emit(e).ok());
}

}  // namespace
}  // namespace runbox
