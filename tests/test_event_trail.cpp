// File: tests/test_event_trail.cpp
#include <filesystem>
#include <string>

#include <gtest/gtest.h>

#include "pl/core/events/jsonl_event_sink.hpp"
#include "pl/core/model/service_runner.hpp"
#include "pl/core/util/repro_hash.hpp"
#include "test_util.hpp"

namespace fs = std::filesystem;

namespace {

int count_lines(const std::string& s) {
  int n = 0;
  for (char c : s) {
    if (c == '\n') ++n;
  }
  return n;
}

}  // namespace

TEST(EventTrail, RunHeaderAndEventsGoToBothFiles) {
  pl::test::TempDir tmp;
  pl::Config cfg;
  cfg.output.events_dir = (tmp / "events").string();

  pl::ServiceRunner runner("capture", cfg, "/etc/printlapse.yaml");
  pl::JsonlEventSink sink;
  ASSERT_TRUE(runner.start(sink).ok());
  ASSERT_TRUE(runner.emit_event(sink, "session_finalized", "said \"done\"", "s1", 12).ok());
  runner.stop(sink);

  EXPECT_EQ(fs::path(sink.latest_path()).filename().string(), "capture_events_latest.jsonl");
  const std::string run = pl::test::read_file(sink.path());
  EXPECT_EQ(run, pl::test::read_file(sink.latest_path()));
  EXPECT_EQ(count_lines(run), 2);

  EXPECT_NE(run.find("\"type\":\"run_started\""), std::string::npos);
  EXPECT_NE(run.find("\"config_hash\":\"" + pl::compute_config_hash(cfg) + "\""),
            std::string::npos);
  EXPECT_NE(run.find("\"session\":\"s1\",\"frame_count\":12"), std::string::npos);
  EXPECT_NE(run.find("\"message\":\"said \\\"done\\\"\""), std::string::npos);
}

TEST(EventTrail, OldRunsArePrunedPerService) {
  pl::test::TempDir tmp;
  const fs::path dir = tmp / "events";
  for (int i = 1; i <= 5; ++i) {
    pl::test::write_file(dir / ("encoder_events_" + std::to_string(i) + ".jsonl"), "{}\n");
  }
  pl::test::write_file(dir / "capture_events_1.jsonl", "{}\n");
  pl::test::write_file(dir / "encoder_events_latest.jsonl", "{}\n");

  pl::Config cfg;
  cfg.output.events_dir = dir.string();
  cfg.output.keep_runs = 2;
  pl::ServiceRunner runner("encoder", cfg, "test.yaml");
  pl::JsonlEventSink sink;
  ASSERT_TRUE(runner.start(sink).ok());
  runner.stop(sink);

  EXPECT_FALSE(fs::exists(dir / "encoder_events_1.jsonl"));
  EXPECT_FALSE(fs::exists(dir / "encoder_events_3.jsonl"));
  EXPECT_TRUE(fs::exists(dir / "encoder_events_4.jsonl"));
  EXPECT_TRUE(fs::exists(dir / "encoder_events_5.jsonl"));
  EXPECT_TRUE(fs::exists(dir / "capture_events_1.jsonl"));
  EXPECT_TRUE(fs::exists(sink.path()));
  EXPECT_EQ(count_lines(pl::test::read_file(sink.latest_path())), 1);
}

TEST(EventTrail, EmitBeforeOpenIsRejected) {
  pl::JsonlEventSink sink;
  pl::Event e;
  e.type = "heartbeat";
  EXPECT_EQ(sink.emit(e).code(), pl::Status::Code::kInvalidArgument);
  EXPECT_EQ(pl::json_escape("a\tb\x01"), "a\\tb\\u0001");
}

TEST(EventTrail, ConfigHashTracksValues) {
  pl::Config a;
  pl::Config b;
  EXPECT_EQ(pl::compute_config_hash(a), pl::compute_config_hash(b));
  b.video.crf = 23;
  EXPECT_NE(pl::compute_config_hash(a), pl::compute_config_hash(b));
}

TEST(EventTrail, RecordEventReportsButSurvivesASinkThatIsNotOpen) {
  pl::test::TempDir tmp;
  pl::Config cfg;
  cfg.output.events_dir = (tmp / "events").string();
  pl::ServiceRunner runner("encoder", cfg, "test.yaml");
  pl::JsonlEventSink sink;

  EXPECT_FALSE(runner.record_event(sink, "encode_started", "", "s1"));
  EXPECT_FALSE(fs::exists(tmp / "events"));

  ASSERT_TRUE(runner.start(sink).ok());
  EXPECT_TRUE(runner.record_event(sink, "heartbeat", "idle"));
  runner.stop(sink);
  EXPECT_EQ(count_lines(pl::test::read_file(sink.path())), 2);
}
