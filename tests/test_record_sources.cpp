#include <gtest/gtest.h>
#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "cx/adapters/lines/lines_record_source.hpp"
#include "cx/adapters/synth/synth_record_source.hpp"

TEST(SynthRecordSourceTest, EmitsSequentialIdsThenEof) {
  cx::SynthRecordSource src(cx::SynthSourceConfig{3});
  cx::Record r;
  for (std::int64_t id = 1; id <= 3; ++id) {
    ASSERT_TRUE(src.next(&r).ok());
    ASSERT_EQ(r.size(), 1u);
    EXPECT_EQ(std::get<std::int64_t>(*r.find("id")), id);
  }
  EXPECT_EQ(src.next(&r).code(), cx::Status::Code::kOutOfRange);
  EXPECT_EQ(src.emitted(), 3);
}

TEST(SynthRecordSourceTest, ZeroCountIsImmediatelyEof) {
  cx::SynthRecordSource src(cx::SynthSourceConfig{0});
  cx::Record r;
  EXPECT_EQ(src.next(&r).code(), cx::Status::Code::kOutOfRange);
  EXPECT_EQ(src.next(nullptr).code(), cx::Status::Code::kInvalidArgument);
}

class LinesRecordSourceTest : public ::testing::Test {
 protected:
  std::string tmp_dir_;

  void SetUp() override {
    char tmpl[] = "/tmp/chunkex_lines_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    tmp_dir_ = dir;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(tmp_dir_, ec);
  }
};

TEST_F(LinesRecordSourceTest, OneRecordPerLine) {
  const std::string path = tmp_dir_ + "/items.txt";
  std::ofstream(path) << "alpha\r\nbeta\n\ngamma";

  cx::LinesRecordSource src(cx::LinesSourceConfig{path});
  ASSERT_TRUE(src.open().ok());

  const char* expected[] = {"alpha", "beta", "", "gamma"};
  cx::Record r;
  for (std::int64_t i = 0; i < 4; ++i) {
    ASSERT_TRUE(src.next(&r).ok());
    EXPECT_EQ(std::get<std::int64_t>(*r.find("line_no")), i + 1);
    EXPECT_EQ(std::get<std::string>(*r.find("text")), expected[i]);
  }
  EXPECT_EQ(src.next(&r).code(), cx::Status::Code::kOutOfRange);
}

TEST_F(LinesRecordSourceTest, NextBeforeOpen) {
  cx::LinesRecordSource src(cx::LinesSourceConfig{tmp_dir_ + "/items.txt"});
  cx::Record r;
  EXPECT_EQ(src.next(&r).code(), cx::Status::Code::kInvalidState);
}

TEST_F(LinesRecordSourceTest, MissingFile) {
  cx::LinesRecordSource src(cx::LinesSourceConfig{tmp_dir_ + "/nope.txt"});
  EXPECT_EQ(src.open().code(), cx::Status::Code::kNotFound);
}
