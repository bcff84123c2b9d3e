// File: src/adapters/file/file_chunk_sink.cpp
#include "cx/adapters/file/file_chunk_sink.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "cx/core/util/text_encoding.hpp"

namespace cx {

Result<FileFormat> parse_file_format(const std::string& name) {
  if (name == "json") return Result<FileFormat>::ok(FileFormat::kJson);
  if (name == "jsonlines" || name == "jl") return Result<FileFormat>::ok(FileFormat::kJsonLines);
  if (name == "csv") return Result<FileFormat>::ok(FileFormat::kCsv);
  return Result<FileFormat>::err(Status::sink_open_error("unknown sink format: '" + name + "'"));
}

Result<std::string> local_path_from_address(const std::string& address) {
  const std::string file_scheme = "file://";
  if (address.rfind(file_scheme, 0) == 0) {
    const std::string path = address.substr(file_scheme.size());
    if (path.empty()) {
      return Result<std::string>::err(Status::sink_open_error("empty path in address: " + address));
    }
    return Result<std::string>::ok(path);
  }
  if (address.find("://") != std::string::npos) {
    return Result<std::string>::err(
        Status::sink_open_error("unsupported address scheme: " + address));
  }
  if (address.empty()) {
    return Result<std::string>::err(Status::sink_open_error("empty address"));
  }
  return Result<std::string>::ok(address);
}

FileChunkSink::FileChunkSink(std::string address, std::string path, FileFormat format)
    : address_(std::move(address)), path_(std::move(path)), format_(format) {}

// An abandoned sink still releases its file, but a json chunk keeps no trailer.
FileChunkSink::~FileChunkSink() {
  if (f_.is_open()) f_.close();
}

Result<std::unique_ptr<FileChunkSink>> FileChunkSink::open(const std::string& address,
                                                           FileFormat format) {
  using R = Result<std::unique_ptr<FileChunkSink>>;
  namespace fs = std::filesystem;

  auto path_r = local_path_from_address(address);
  if (!path_r.ok()) return R::err(path_r.status());
  const std::string path = path_r.take_value();

  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      return R::err(Status::sink_open_error("failed creating directory '" + parent.string() +
                                            "': " + ec.message()));
    }
  }

  std::unique_ptr<FileChunkSink> sink(new FileChunkSink(address, path, format));
  sink->f_.open(path, std::ios::out | std::ios::trunc);
  if (!sink->f_.is_open()) return R::err(Status::sink_open_error("failed opening '" + path + "'"));

  if (format == FileFormat::kJson) sink->f_ << "[";
  if (!sink->f_.good()) return R::err(Status::sink_open_error("failed writing to '" + path + "'"));

  sink->open_ = true;
  return R::ok(std::move(sink));
}

std::string FileChunkSink::render_(const Record& record) {
  switch (format_) {
    case FileFormat::kJson:
      return (written_ == 0 ? "\n" : ",\n") + record_to_json(record);

    case FileFormat::kJsonLines:
      return record_to_json(record) + "\n";

    case FileFormat::kCsv: {
      std::string out;
      if (written_ == 0) {
        csv_columns_.clear();
        for (const auto& f : record.fields) csv_columns_.push_back(f.first);
        for (std::size_t i = 0; i < csv_columns_.size(); ++i) {
          if (i > 0) out += ",";
          out += csv_escape(csv_columns_[i]);
        }
        out += "\n";
      }
      // Columns are fixed by the first record; missing fields stay empty.
      for (std::size_t i = 0; i < csv_columns_.size(); ++i) {
        if (i > 0) out += ",";
        if (const FieldValue* v = record.find(csv_columns_[i])) out += csv_escape(field_to_text(*v));
      }
      out += "\n";
      return out;
    }
  }
  return std::string();
}

Status FileChunkSink::write(const Record& record) {
  if (!open_) return Status::invalid_state("FileChunkSink::write called after close: " + path_);

  f_ << render_(record);
  if (!f_.good()) return Status::sink_write_error("failed writing to '" + path_ + "'");

  ++written_;
  return Status::ok_status();
}

Result<std::int64_t> FileChunkSink::close() {
  if (!open_) {
    return Result<std::int64_t>::err(
        Status::invalid_state("FileChunkSink::close called twice: " + path_));
  }
  open_ = false;

  if (format_ == FileFormat::kJson) f_ << (written_ == 0 ? "]\n" : "\n]\n");
  f_.flush();
  const bool good = f_.good();
  f_.close();

  if (!good) return Result<std::int64_t>::err(Status::sink_write_error("failed finalizing '" + path_ + "'"));
  return Result<std::int64_t>::ok(written_);
}

Result<std::unique_ptr<ChunkSink>> FileChunkSinkFactory::open(const std::string& address,
                                                              const std::string& format) {
  using R = Result<std::unique_ptr<ChunkSink>>;

  auto fmt_r = parse_file_format(format);
  if (!fmt_r.ok()) return R::err(fmt_r.status());

  auto sink_r = FileChunkSink::open(address, fmt_r.take_value());
  if (!sink_r.ok()) return R::err(sink_r.status());
  return R::ok(sink_r.take_value());
}

}  // namespace cx
