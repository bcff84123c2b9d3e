// File: include/cx/core/events/event_sink.hpp
#pragma once

#include <cstdint>
#include <string>

#include "cx/core/status.hpp"
#include "cx/core/types.hpp"

namespace cx {

// Run event model.
// Keep output stable and boring; evolve by adding fields (not breaking existing ones).

struct RunInfo {
  JobId job_id;
  std::string project;
  ProjectId project_id;

  std::string config_path;
  std::string events_dir;
  std::string config_hash;

  TimestampNs wall_start_time;
};

struct Event {
  std::string type;  // e.g. "chunk_opened", "chunk_closed", "run_finished"
  TimestampNs t_wall;

  // Chunk fields (optional). chunk_number == 0 means a run-level event.
  std::int64_t chunk_number = 0;
  std::string address;
  std::int64_t items = -1;  // < 0: not reported

  std::string message;  // optional human-readable hint
};

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual Status open(const RunInfo& run) = 0;
  virtual Status emit(const Event& e) = 0;
  virtual Status flush() = 0;
  virtual void close() = 0;
};

}  // namespace cx
