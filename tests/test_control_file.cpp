// File: tests/test_control_file.cpp
#include <gtest/gtest.h>

#include "pl/core/session/control_file.hpp"
#include "test_util.hpp"

TEST(ControlFile, StartReadStop) {
  pl::test::TempDir tmp;
  pl::ControlFile control(tmp / "state" / ".timelapse_recording");

  EXPECT_FALSE(control.read().has_value());

  ASSERT_TRUE(control.start("  bracket test \n").ok());
  EXPECT_EQ(control.read().value_or(""), "bracket test");

  auto stopped = control.stop();
  ASSERT_TRUE(stopped.ok());
  EXPECT_EQ(stopped->value_or(""), "bracket test");
  EXPECT_FALSE(control.read().has_value());

  auto again = control.stop();
  ASSERT_TRUE(again.ok());
  EXPECT_FALSE(again->has_value());
}

TEST(ControlFile, BlankContentIsNoSignal) {
  pl::test::TempDir tmp;
  pl::test::write_file(tmp / "rec", "\n  \n");
  EXPECT_FALSE(pl::ControlFile(tmp / "rec").read().has_value());

  pl::ControlFile control(tmp / "rec2");
  EXPECT_EQ(control.start("   ").code(), pl::Status::Code::kInvalidArgument);
}
