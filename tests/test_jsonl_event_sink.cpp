#include <gtest/gtest.h>
#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "cx/core/events/jsonl_event_sink.hpp"

namespace {

class JsonlEventSinkTest : public ::testing::Test {
 protected:
  std::string tmp_dir_;

  void SetUp() override {
    char tmpl[] = "/tmp/chunkex_events_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    tmp_dir_ = dir;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(tmp_dir_, ec);
  }

  static std::vector<std::string> read_lines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream ifs(path);
    std::string line;
    while (std::getline(ifs, line)) lines.push_back(line);
    return lines;
  }

  cx::RunInfo make_run() const {
    cx::RunInfo run;
    run.job_id = "1/2/3";
    run.project = "crawler";
    run.project_id = "1";
    run.config_path = "cfg.yaml";
    run.events_dir = tmp_dir_ + "/events";
    run.config_hash = "00000000deadbeef";
    run.wall_start_time = cx::TimestampNs{1700000000000000000LL};
    return run;
  }
};

}  // namespace

TEST_F(JsonlEventSinkTest, WritesRunFileAndLatest) {
  cx::JsonlEventSink sink;
  ASSERT_TRUE(sink.open(make_run()).ok());
  EXPECT_EQ(sink.path(), tmp_dir_ + "/events/events_1700000000000000000.jsonl");
  EXPECT_EQ(sink.latest_path(), tmp_dir_ + "/events/events_latest.jsonl");

  cx::Event e;
  e.type = "chunk_closed";
  e.t_wall = cx::TimestampNs{1700000001000000000LL};
  e.chunk_number = 3;
  e.address = "out/export_03.json";
  e.items = 25;
  ASSERT_TRUE(sink.emit(e).ok());
  ASSERT_TRUE(sink.flush().ok());
  sink.close();

  const auto lines = read_lines(sink.path());
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_NE(lines[0].find("\"type\":\"run_started\""), std::string::npos);
  EXPECT_NE(lines[0].find("\"job_id\":\"1/2/3\""), std::string::npos);
  EXPECT_NE(lines[0].find("\"config_hash\":\"00000000deadbeef\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"type\":\"chunk_closed\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"chunk_number\":3"), std::string::npos);
  EXPECT_NE(lines[1].find("\"address\":\"out/export_03.json\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"items\":25"), std::string::npos);

  EXPECT_EQ(read_lines(sink.latest_path()), lines);
}

TEST_F(JsonlEventSinkTest, RunLevelEventOmitsChunkFields) {
  cx::JsonlEventSink sink;
  ASSERT_TRUE(sink.open(make_run()).ok());

  cx::Event e;
  e.type = "run_failed";
  e.message = "bad \"thing\"";
  ASSERT_TRUE(sink.emit(e).ok());
  sink.close();

  const auto lines = read_lines(sink.path());
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[1].find("chunk_number"), std::string::npos);
  EXPECT_EQ(lines[1].find("\"items\""), std::string::npos);
  EXPECT_NE(lines[1].find("\"message\":\"bad \\\"thing\\\"\""), std::string::npos);
}

TEST_F(JsonlEventSinkTest, EmitWhileClosedFails) {
  cx::JsonlEventSink sink;
  cx::Event e;
  e.type = "x";
  EXPECT_EQ(sink.emit(e).code(), cx::Status::Code::kInvalidState);
}
