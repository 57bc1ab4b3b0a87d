// File: tests/test_config_loader.cpp
#include <cstdlib>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "pl/core/util/config_loader.hpp"
#include "test_util.hpp"

TEST(ConfigLoader, DefaultsApplyForMissingSections) {
  pl::test::TempDir tmp;
  pl::test::write_file(tmp / "c.yaml", "printer:\n  host: 192.168.1.50\n");

  auto cfg = pl::load_config((tmp / "c.yaml").string());
  ASSERT_TRUE(cfg.ok()) << cfg.status().message();
  EXPECT_EQ(cfg->printer.host, "192.168.1.50");
  EXPECT_EQ(cfg->timelapse.capture_interval_s, 30);
  EXPECT_EQ(cfg->timelapse.finishing_threshold_pct, 98);
  EXPECT_EQ(cfg->timelapse.post_print_frames, 24);
  EXPECT_EQ(cfg->timelapse.stop_debounce, 3);
  EXPECT_EQ(cfg->storage.min_free_mb, 2048);
  EXPECT_EQ(cfg->video.timeout_s, 3600);
  EXPECT_DOUBLE_EQ(cfg->encoder.stale_age_hours, 2.0);
  EXPECT_EQ(cfg->mount.check_interval_s, 300);
}

TEST(ConfigLoader, IncludesAreOverriddenByTheIncludingFile) {
  pl::test::TempDir tmp;
  pl::test::write_file(tmp / "base" / "defaults.yaml",
                       "timelapse:\n  capture_interval_s: 20\n  stop_debounce: 5\n"
                       "video:\n  preset: Medium\n");
  pl::test::write_file(tmp / "site.yaml",
                       "includes: [\"base/defaults.yaml\"]\n"
                       "timelapse:\n  capture_interval_s: 15\n"
                       "mount:\n  mount_command: [\"mount\", \"-t\", \"cifs\"]\n");

  auto cfg = pl::load_config((tmp / "site.yaml").string());
  ASSERT_TRUE(cfg.ok()) << cfg.status().message();
  EXPECT_EQ(cfg->timelapse.capture_interval_s, 15);
  EXPECT_EQ(cfg->timelapse.stop_debounce, 5);
  EXPECT_EQ(cfg->video.preset, "medium");
  EXPECT_EQ(cfg->mount.mount_command, (std::vector<std::string>{"mount", "-t", "cifs"}));
}

TEST(ConfigLoader, HomeIsExpandedInPaths) {
  pl::test::TempDir tmp;
  ::setenv("HOME", tmp.path().c_str(), 1);
  pl::test::write_file(tmp / "c.yaml", "storage:\n  fallback_root: ~/timelapse_local\n");

  auto cfg = pl::load_config((tmp / "c.yaml").string());
  ASSERT_TRUE(cfg.ok()) << cfg.status().message();
  EXPECT_EQ(cfg->storage.fallback_root, (tmp / "timelapse_local").string());
  EXPECT_EQ(cfg->timelapse.control_file, (tmp / ".timelapse_recording").string());
}

TEST(ConfigLoader, RejectsOutOfRangeValues) {
  pl::test::TempDir tmp;
  pl::test::write_file(tmp / "rot.yaml", "video:\n  rotation_deg: 45\n");
  pl::test::write_file(tmp / "preset.yaml", "video:\n  preset: turbo\n");
  pl::test::write_file(tmp / "debounce.yaml", "timelapse:\n  stop_debounce: 0\n");

  for (const char* name : {"rot.yaml", "preset.yaml", "debounce.yaml"}) {
    auto cfg = pl::load_config((tmp / name).string());
    ASSERT_FALSE(cfg.ok()) << name;
    EXPECT_EQ(cfg.status().code(), pl::Status::Code::kInvalidArgument) << name;
  }
}

TEST(ConfigLoader, TypeMismatchIsAParseError) {
  pl::test::TempDir tmp;
  pl::test::write_file(tmp / "c.yaml", "timelapse:\n  capture_interval_s: often\n");

  auto cfg = pl::load_config((tmp / "c.yaml").string());
  ASSERT_FALSE(cfg.ok());
  EXPECT_EQ(cfg.status().code(), pl::Status::Code::kParseError);
}

TEST(ConfigLoader, MissingFileIsNotFound) {
  auto cfg = pl::load_config("/nonexistent/printlapse.yaml");
  ASSERT_FALSE(cfg.ok());
  EXPECT_EQ(cfg.status().code(), pl::Status::Code::kNotFound);
}

TEST(ConfigLoader, UploadNeedsTokenWhenEnabled) {
  pl::test::TempDir tmp;
  pl::test::write_file(tmp / "c.yaml", "upload:\n  enabled: true\n");

  auto cfg = pl::load_config((tmp / "c.yaml").string());
  ASSERT_FALSE(cfg.ok());
  EXPECT_EQ(cfg.status().code(), pl::Status::Code::kInvalidArgument);
}
