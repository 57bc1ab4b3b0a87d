// File: tests/test_prusalink_parse.cpp
#include <string>

#include <gtest/gtest.h>

#include "pl/adapters/prusalink/prusalink_poller.hpp"

TEST(PrusaLinkParse, PrintingJob) {
  const std::string body = R"({
    "printer": {"state": "PRINTING", "temp_nozzle": 215.0},
    "job": {"id": 412, "progress": 42.5, "time_remaining": 3600, "state": "PRINTING",
            "display_name": "benchy.gcode"}
  })";

  auto st = pl::parse_status_body(body);
  ASSERT_TRUE(st.ok()) << st.status().message();
  EXPECT_TRUE(st->is_printing);
  EXPECT_TRUE(st->is_job_active);
  EXPECT_EQ(st->job_id.value_or(-1), 412);
  EXPECT_EQ(st->job_name.value_or(""), "benchy.gcode");
  EXPECT_FLOAT_EQ(st->progress_percent.value_or(-1.0f), 42.5f);
  EXPECT_EQ(st->state_text, "PRINTING");
}

TEST(PrusaLinkParse, PausedKeepsJobActiveWithoutCapture) {
  auto st = pl::parse_status_body(R"({"job": {"id": 1, "state": "paused"}})");
  ASSERT_TRUE(st.ok());
  EXPECT_FALSE(st->is_printing);
  EXPECT_TRUE(st->is_job_active);
  EXPECT_EQ(st->state_text, "PAUSED");
}

TEST(PrusaLinkParse, TerminalStatesEndTheJob) {
  for (const char* s : {"FINISHED", "STOPPED", "ERROR"}) {
    auto st = pl::parse_status_body(std::string(R"({"job": {"id": 9, "state": ")") + s + R"("}})");
    ASSERT_TRUE(st.ok()) << s;
    EXPECT_FALSE(st->is_job_active) << s;
    EXPECT_FALSE(st->is_printing) << s;
  }
}

TEST(PrusaLinkParse, PrinterStateIsTheFallback) {
  auto st = pl::parse_status_body(R"({"printer": {"state": "IDLE"}})");
  ASSERT_TRUE(st.ok());
  EXPECT_EQ(st->state_text, "IDLE");
  EXPECT_FALSE(st->job_id.has_value());
  EXPECT_FALSE(st->is_job_active);

  auto printing = pl::parse_status_body(R"({"printer": {"state": "PRINTING"}})");
  ASSERT_TRUE(printing.ok());
  EXPECT_TRUE(printing->is_printing);
}

TEST(PrusaLinkParse, NestedFileDisplayName) {
  auto st = pl::parse_status_body(
      R"({"job": {"id": 3, "state": "PRINTING", "file": {"display_name": "cube.bgcode"}}})");
  ASSERT_TRUE(st.ok());
  EXPECT_EQ(st->job_name.value_or(""), "cube.bgcode");
}

TEST(PrusaLinkParse, MalformedBodies) {
  EXPECT_EQ(pl::parse_status_body("{not json").status().code(), pl::Status::Code::kParseError);
  EXPECT_EQ(pl::parse_status_body("[1, 2]").status().code(), pl::Status::Code::kParseError);
  EXPECT_EQ(pl::parse_status_body(R"({"job": {"progress": "lots"}})").status().code(),
            pl::Status::Code::kParseError);
}

TEST(PrusaLinkParse, JobEndpointName) {
  EXPECT_EQ(pl::parse_job_name(R"({"id": 3, "file": {"name": "CUBE~1.BGC", "display_name": "cube.bgcode"}})")
                .value_or(""),
            "cube.bgcode");
  EXPECT_EQ(pl::parse_job_name(R"({"file": {"name": "CUBE~1.BGC"}})").value_or(""), "CUBE~1.BGC");
  EXPECT_FALSE(pl::parse_job_name(R"({"id": 3})").has_value());
  EXPECT_FALSE(pl::parse_job_name("garbage{").has_value());
}

TEST(PrusaLinkPoller, UrlsAddSchemeOnlyWhenMissing) {
  pl::PrinterConfig cfg;
  cfg.host = "192.168.1.50";
  EXPECT_EQ(pl::PrusaLinkPoller(cfg).status_url(), "http://192.168.1.50/api/v1/status");
  EXPECT_EQ(pl::PrusaLinkPoller(cfg).job_url(), "http://192.168.1.50/api/v1/job");

  cfg.host = "https://printer.local:8443";
  EXPECT_EQ(pl::PrusaLinkPoller(cfg).status_url(), "https://printer.local:8443/api/v1/status");
}
