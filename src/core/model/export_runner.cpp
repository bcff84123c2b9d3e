// File: src/core/model/export_runner.cpp
#include "cx/core/model/export_runner.hpp"

#include <utility>

#include "cx/core/util/repro_hash.hpp"

namespace cx {

ExportRunner::ExportRunner(Config cfg, std::string config_path, WallClock clock)
    : cfg_(std::move(cfg)),
      config_path_(std::move(config_path)),
      clock_(clock ? std::move(clock) : WallClock(system_wall_now)) {}

Status ExportRunner::emit_event(EventSink& sink, const std::string& type,
                                const std::string& message) {
  Event e;
  e.type = type;
  e.t_wall = clock_();
  e.message = message;
  return sink.emit(e);
}

Status ExportRunner::run(RecordSource& source, ChunkSinkFactory& sinks, EventSink& events,
                         const std::atomic<bool>* stop) {
  if (ran_) return Status::invalid_state("ExportRunner::run may only be called once");
  ran_ = true;

  JobIdentity identity;
  identity.job_id = cfg_.job.job_id.empty() ? kNoJob : cfg_.job.job_id;
  identity.project = cfg_.job.project.empty() ? kNoProject : cfg_.job.project;
  identity.project_id = cfg_.job.project_id.empty() ? kNoProjectId : cfg_.job.project_id;

  RunInfo info;
  info.job_id = identity.job_id;
  info.project = identity.project;
  info.project_id = identity.project_id;
  info.config_path = config_path_;
  info.events_dir = cfg_.output.events_dir;
  info.config_hash = compute_config_hash(cfg_);
  info.wall_start_time = clock_();

  CX_RETURN_IF_ERROR(events.open(info));

  ChunkRotator rotator(cfg_.feed, RotationContext(identity, cfg_.feed.timestamp_format, clock_),
                       sinks, &events);

  Status first_error = rotator.start();

  if (first_error.ok()) {
    Record record;
    while (true) {
      if (stop && stop->load()) {
        stopped_early_ = true;
        first_error = emit_event(events, "shutdown", "stop requested");
        break;
      }

      const Status st = source.next(&record);
      if (st.code() == Status::Code::kOutOfRange) break;
      if (!st.ok()) {
        first_error = st;
        break;
      }

      const Status sub = rotator.submit(record);
      if (!sub.ok()) {
        first_error = sub;
        break;
      }
    }
  }

  // Ensure the last chunk is always closed, error or not.
  if (rotator.state() == ChunkRotator::State::kOpen) {
    const Status fin = rotator.finish();
    if (first_error.ok()) first_error = fin;
  }

  // Event log trouble is reported only after the data is safely out.
  if (first_error.ok()) first_error = rotator.event_status();

  chunks_ = rotator.chunks();
  records_exported_ = rotator.total_items();

  const Status st_end = first_error.ok()
                            ? emit_event(events, "run_finished",
                                         "records=" + std::to_string(records_exported_) +
                                             " chunks=" + std::to_string(chunks_.size()))
                            : emit_event(events, "run_failed", first_error.message());
  const Status st_flush = events.flush();
  events.close();

  if (!first_error.ok()) return first_error;
  if (!st_end.ok()) return st_end;
  return st_flush;
}

}  // namespace cx
