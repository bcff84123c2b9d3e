// File: src/core/events/jsonl_event_sink.cpp
#include "cx/core/events/jsonl_event_sink.hpp"

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>

#include "cx/core/util/text_encoding.hpp"

namespace cx {
namespace {

double ns_to_s(std::int64_t ns) { return static_cast<double>(ns) * 1e-9; }

std::string join_path(const std::string& a, const std::string& b) {
  namespace fs = std::filesystem;
  return (fs::path(a) / fs::path(b)).string();
}

std::string quoted(const std::string& s) { return "\"" + json_escape(s) + "\""; }

}  // namespace

JsonlEventSink::~JsonlEventSink() { close(); }

Status JsonlEventSink::open(const RunInfo& run) {
  close();

  std::error_code ec;
  std::filesystem::create_directories(run.events_dir, ec);
  if (ec) {
    return Status::io_error("failed creating events_dir '" + run.events_dir + "': " + ec.message());
  }

  const std::int64_t wall0 = run.wall_start_time.ns;

  path_ = join_path(run.events_dir, "events_" + std::to_string(wall0) + ".jsonl");
  latest_path_ = join_path(run.events_dir, "events_latest.jsonl");

  f_.open(path_, std::ios::out | std::ios::trunc);
  if (!f_.is_open()) return Status::io_error("failed opening '" + path_ + "'");

  latest_.open(latest_path_, std::ios::out | std::ios::trunc);
  if (!latest_.is_open()) return Status::io_error("failed opening '" + latest_path_ + "'");

  open_ = true;

  // Run header line (written to BOTH files).
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);
  ss << "{"
     << "\"type\":\"run_started\","
     << "\"t_wall_ns\":" << wall0 << ","
     << "\"t_wall_s\":" << ns_to_s(wall0) << ","
     << "\"job_id\":" << quoted(run.job_id) << ","
     << "\"project\":" << quoted(run.project) << ","
     << "\"project_id\":" << quoted(run.project_id) << ","
     << "\"config_path\":" << quoted(run.config_path) << ","
     << "\"config_hash\":" << quoted(run.config_hash)
     << "}";

  CX_RETURN_IF_ERROR(write_line_(ss.str()));
  return flush();
}

Status JsonlEventSink::emit(const Event& e) {
  if (!open_) return Status::invalid_state("JsonlEventSink::emit called while not open");

  const std::int64_t tw = e.t_wall.ns;

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(6);

  ss << "{"
     << "\"type\":" << quoted(e.type) << ","
     << "\"t_wall_ns\":" << tw << ","
     << "\"t_wall_s\":" << ns_to_s(tw);

  if (e.chunk_number > 0) ss << ",\"chunk_number\":" << e.chunk_number;
  if (!e.address.empty()) ss << ",\"address\":" << quoted(e.address);
  if (e.items >= 0) ss << ",\"items\":" << e.items;
  if (!e.message.empty()) ss << ",\"message\":" << quoted(e.message);

  ss << "}";

  return write_line_(ss.str());
}

Status JsonlEventSink::write_line_(const std::string& line) {
  f_ << line << "\n";
  latest_ << line << "\n";

  if (!f_.good()) return Status::io_error("failed writing to '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed writing to '" + latest_path_ + "'");

  return Status{};
}

Status JsonlEventSink::flush() {
  if (!open_) return Status{};

  f_.flush();
  latest_.flush();

  if (!f_.good()) return Status::io_error("failed flushing '" + path_ + "'");
  if (!latest_.good()) return Status::io_error("failed flushing '" + latest_path_ + "'");

  return Status{};
}

void JsonlEventSink::close() {
  if (f_.is_open()) f_.close();
  if (latest_.is_open()) latest_.close();
  open_ = false;
}

}  // namespace cx
