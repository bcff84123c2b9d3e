#include <gtest/gtest.h>
#include <stdlib.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "cx/adapters/file/file_chunk_sink.hpp"

namespace {

class FileChunkSinkTest : public ::testing::Test {
 protected:
  std::string tmp_dir_;

  void SetUp() override {
    char tmpl[] = "/tmp/chunkex_sink_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    tmp_dir_ = dir;
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(tmp_dir_, ec);
  }

  static std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) return "";
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
  }

  std::unique_ptr<cx::ChunkSink> open_ok(const std::string& address, const std::string& format) {
    auto r = factory_.open(address, format);
    EXPECT_TRUE(r.ok()) << r.status().message();
    return r.ok() ? r.take_value() : nullptr;
  }

  cx::FileChunkSinkFactory factory_;
};

cx::Record item(std::int64_t id, const std::string& name) {
  cx::Record r;
  r.set("id", id).set("name", name);
  return r;
}

}  // namespace

TEST_F(FileChunkSinkTest, JsonArrayPerChunk) {
  const std::string path = tmp_dir_ + "/export_01.json";
  auto sink = open_ok(path, "json");
  ASSERT_NE(sink, nullptr);

  ASSERT_TRUE(sink->write(item(1, "a")).ok());
  ASSERT_TRUE(sink->write(item(2, "b\"q")).ok());
  auto closed = sink->close();
  ASSERT_TRUE(closed.ok());
  EXPECT_EQ(closed.value(), 2);

  EXPECT_EQ(read_file(path), "[\n{\"id\":1,\"name\":\"a\"},\n{\"id\":2,\"name\":\"b\\\"q\"}\n]\n");
}

TEST_F(FileChunkSinkTest, EmptyJsonChunkIsEmptyArray) {
  const std::string path = tmp_dir_ + "/empty.json";
  auto sink = open_ok(path, "json");
  ASSERT_NE(sink, nullptr);
  auto closed = sink->close();
  ASSERT_TRUE(closed.ok());
  EXPECT_EQ(closed.value(), 0);
  EXPECT_EQ(read_file(path), "[]\n");
}

TEST_F(FileChunkSinkTest, JsonLines) {
  const std::string path = tmp_dir_ + "/part.jl";
  auto sink = open_ok(path, "jsonlines");
  ASSERT_NE(sink, nullptr);
  ASSERT_TRUE(sink->write(item(1, "x")).ok());
  ASSERT_TRUE(sink->write(item(2, "y")).ok());
  ASSERT_TRUE(sink->close().ok());

  EXPECT_EQ(read_file(path), "{\"id\":1,\"name\":\"x\"}\n{\"id\":2,\"name\":\"y\"}\n");
}

TEST_F(FileChunkSinkTest, CsvHeaderFromFirstRecord) {
  const std::string path = tmp_dir_ + "/part.csv";
  auto sink = open_ok(path, "csv");
  ASSERT_NE(sink, nullptr);

  ASSERT_TRUE(sink->write(item(1, "plain")).ok());
  cx::Record partial;
  partial.set("id", std::int64_t{2});
  ASSERT_TRUE(sink->write(partial).ok());
  ASSERT_TRUE(sink->write(item(3, "with,comma")).ok());
  ASSERT_TRUE(sink->close().ok());

  EXPECT_EQ(read_file(path), "id,name\n1,plain\n2,\n3,\"with,comma\"\n");
}

TEST_F(FileChunkSinkTest, DoublesKeepEveryBit) {
  const double price = 0.1 + 0.2;
  const double big = 1234567890.123456789;

  const std::string jl_path = tmp_dir_ + "/prices.jl";
  auto jl = open_ok(jl_path, "jsonlines");
  ASSERT_NE(jl, nullptr);
  cx::Record r;
  r.set("price", price).set("big", big);
  ASSERT_TRUE(jl->write(r).ok());
  ASSERT_TRUE(jl->close().ok());

  const std::string text = read_file(jl_path);
  const auto value_after = [&text](const std::string& key) {
    const std::size_t pos = text.find("\"" + key + "\":");
    EXPECT_NE(pos, std::string::npos) << key;
    return std::strtod(text.c_str() + pos + key.size() + 3, nullptr);
  };
  EXPECT_EQ(value_after("price"), price);
  EXPECT_EQ(value_after("big"), big);

  const std::string csv_path = tmp_dir_ + "/prices.csv";
  auto csv = open_ok(csv_path, "csv");
  ASSERT_NE(csv, nullptr);
  ASSERT_TRUE(csv->write(r).ok());
  ASSERT_TRUE(csv->close().ok());

  std::istringstream rows(read_file(csv_path));
  std::string header, row;
  ASSERT_TRUE(static_cast<bool>(std::getline(rows, header)));
  ASSERT_TRUE(static_cast<bool>(std::getline(rows, row)));
  const std::size_t comma = row.find(',');
  ASSERT_NE(comma, std::string::npos);
  EXPECT_EQ(std::strtod(row.substr(0, comma).c_str(), nullptr), price);
  EXPECT_EQ(std::strtod(row.substr(comma + 1).c_str(), nullptr), big);
}

TEST_F(FileChunkSinkTest, FileUriAndNestedDirectories) {
  const std::string path = tmp_dir_ + "/a/b/c/chunk.jl";
  auto sink = open_ok("file://" + path, "jl");
  ASSERT_NE(sink, nullptr);
  EXPECT_EQ(sink->address(), "file://" + path);
  ASSERT_TRUE(sink->write(item(1, "x")).ok());
  ASSERT_TRUE(sink->close().ok());
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(FileChunkSinkTest, CloseTwiceIsInvalidState) {
  auto sink = open_ok(tmp_dir_ + "/twice.jl", "jsonlines");
  ASSERT_NE(sink, nullptr);
  ASSERT_TRUE(sink->close().ok());

  auto again = sink->close();
  ASSERT_FALSE(again.ok());
  EXPECT_EQ(again.status().code(), cx::Status::Code::kInvalidState);
  EXPECT_EQ(sink->write(item(1, "late")).code(), cx::Status::Code::kInvalidState);
}

TEST_F(FileChunkSinkTest, RejectsUnknownFormat) {
  auto r = factory_.open(tmp_dir_ + "/x.xml", "xml");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), cx::Status::Code::kSinkOpen);
  EXPECT_FALSE(std::filesystem::exists(tmp_dir_ + "/x.xml"));
}

TEST_F(FileChunkSinkTest, RejectsRemoteScheme) {
  auto r = factory_.open("s3://bucket/key.json", "json");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), cx::Status::Code::kSinkOpen);
}

TEST_F(FileChunkSinkTest, RejectsUnwritableDestination) {
  // The parent "directory" is a regular file.
  const std::string blocker = tmp_dir_ + "/blocker";
  std::ofstream(blocker) << "x";
  auto r = factory_.open(blocker + "/chunk.json", "json");
  ASSERT_FALSE(r.ok());
  EXPECT_EQ(r.status().code(), cx::Status::Code::kSinkOpen);
}

TEST(LocalPathFromAddressTest, Forms) {
  EXPECT_EQ(cx::local_path_from_address("out/a.json").value(), "out/a.json");
  EXPECT_EQ(cx::local_path_from_address("file:///tmp/a.json").value(), "/tmp/a.json");
  EXPECT_FALSE(cx::local_path_from_address("file://").ok());
  EXPECT_FALSE(cx::local_path_from_address("").ok());
  EXPECT_FALSE(cx::local_path_from_address("ftp://host/a.json").ok());
}
