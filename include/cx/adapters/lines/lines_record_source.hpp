// File: include/cx/adapters/lines/lines_record_source.hpp
#pragma once

#include <cstdint>
#include <fstream>
#include <string>

#include "cx/core/io/record_source.hpp"

namespace cx {

struct LinesSourceConfig {
  std::string path;  // text file, one record per line
};

// Emits {"line_no": n, "text": "<line>"} per line (n starts at 1).
class LinesRecordSource final : public RecordSource {
 public:
  explicit LinesRecordSource(LinesSourceConfig cfg);

  // Call once after construction. Keeps ctor simple (no implicit IO).
  Status open();

  Status next(Record* out) override;
  void close();

  std::string name() const override { return "lines"; }

 private:
  LinesSourceConfig cfg_;
  std::ifstream f_;
  bool opened_{false};
  std::int64_t line_no_{0};
};

}  // namespace cx
