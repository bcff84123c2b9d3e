// File: src/adapters/lines/lines_record_source.cpp
#include "cx/adapters/lines/lines_record_source.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace cx {

LinesRecordSource::LinesRecordSource(LinesSourceConfig cfg) : cfg_(std::move(cfg)) {}

Status LinesRecordSource::open() {
  namespace fs = std::filesystem;

  if (cfg_.path.empty()) return Status::invalid_argument("LinesRecordSource: path is empty");
  close();

  std::error_code ec;
  if (!fs::exists(cfg_.path, ec)) {
    return Status::not_found("LinesRecordSource: file not found: " + cfg_.path);
  }
  if (!fs::is_regular_file(cfg_.path, ec)) {
    return Status::invalid_argument("LinesRecordSource: not a regular file: " + cfg_.path);
  }

  f_.open(cfg_.path);
  if (!f_.is_open()) return Status::io_error("LinesRecordSource: failed to open " + cfg_.path);

  opened_ = true;
  line_no_ = 0;
  return Status::ok_status();
}

Status LinesRecordSource::next(Record* out) {
  if (!out) return Status::invalid_argument("LinesRecordSource::next: out is null");
  if (!opened_) return Status::invalid_state("LinesRecordSource::next: not opened");

  std::string line;
  if (!std::getline(f_, line)) {
    if (f_.bad()) return Status::io_error("LinesRecordSource: read failed: " + cfg_.path);
    return Status::out_of_range("eof");
  }
  if (!line.empty() && line.back() == '\r') line.pop_back();

  ++line_no_;
  out->fields.clear();
  out->set("line_no", line_no_).set("text", std::move(line));
  return Status::ok_status();
}

void LinesRecordSource::close() {
  if (f_.is_open()) f_.close();
  f_.clear();
  opened_ = false;
  line_no_ = 0;
}

}  // namespace cx
