// File: include/cx/adapters/file/file_chunk_sink.hpp
#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "cx/core/sinks/chunk_sink.hpp"

namespace cx {

enum class FileFormat {
  kJson,       // one JSON array per chunk, one object per line
  kJsonLines,  // one JSON object per line
  kCsv,        // header row from the first record's field names
};

Result<FileFormat> parse_file_format(const std::string& name);

// Accepts "file:///abs/path", "file://rel/path" and plain paths. Any other
// scheme is rejected.
Result<std::string> local_path_from_address(const std::string& address);

class FileChunkSink final : public ChunkSink {
 public:
  ~FileChunkSink() override;

  // Creates parent directories and truncates the target.
  static Result<std::unique_ptr<FileChunkSink>> open(const std::string& address,
                                                     FileFormat format);

  Status write(const Record& record) override;
  Result<std::int64_t> close() override;

  const std::string& address() const override { return address_; }
  const std::string& path() const { return path_; }

 private:
  FileChunkSink(std::string address, std::string path, FileFormat format);

  std::string render_(const Record& record);

  std::string address_;
  std::string path_;
  FileFormat format_;

  std::ofstream f_;
  bool open_{false};
  std::int64_t written_{0};
  std::vector<std::string> csv_columns_;
};

class FileChunkSinkFactory final : public ChunkSinkFactory {
 public:
  Result<std::unique_ptr<ChunkSink>> open(const std::string& address,
                                          const std::string& format) override;
};

}  // namespace cx
