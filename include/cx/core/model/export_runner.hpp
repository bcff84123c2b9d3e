// File: include/cx/core/model/export_runner.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "cx/core/config.hpp"
#include "cx/core/events/event_sink.hpp"
#include "cx/core/io/record_source.hpp"
#include "cx/core/model/chunk_rotator.hpp"
#include "cx/core/model/rotation_context.hpp"
#include "cx/core/sinks/chunk_sink.hpp"
#include "cx/core/status.hpp"

namespace cx {

// ExportRunner owns one run: event log lifecycle plus the record pump.
// The rotator is always finished before run() returns, whatever went wrong,
// so the last chunk is never left open. The first error wins.
class ExportRunner {
 public:
  ExportRunner(Config cfg, std::string config_path, WallClock clock = system_wall_now);

  // Pumps `source` into chunks until eof, an error, or `*stop` turns true.
  // A stop request is not an error. May be called once.
  Status run(RecordSource& source, ChunkSinkFactory& sinks, EventSink& events,
             const std::atomic<bool>* stop = nullptr);

  const std::vector<ChunkSummary>& chunks() const { return chunks_; }
  std::int64_t records_exported() const { return records_exported_; }
  bool stopped_early() const { return stopped_early_; }

 private:
  Status emit_event(EventSink& sink, const std::string& type, const std::string& message);

  Config cfg_;
  std::string config_path_;
  WallClock clock_;

  bool ran_{false};
  bool stopped_early_{false};
  std::int64_t records_exported_{0};
  std::vector<ChunkSummary> chunks_;
};

}  // namespace cx
