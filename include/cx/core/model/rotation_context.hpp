// File: include/cx/core/model/rotation_context.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "cx/core/config.hpp"
#include "cx/core/types.hpp"
#include "cx/core/uri/uri_template.hpp"

namespace cx {

using WallClock = std::function<TimestampNs()>;

// Identity values baked into every chunk address. Resolved once by the config
// layer (YAML, then environment, then sentinels) and injected here.
struct JobIdentity {
  JobId job_id = kNoJob;
  std::string project = kNoProject;
  ProjectId project_id = kNoProjectId;
};

TimestampNs system_wall_now();

// Renders `t` in UTC with a strftime pattern.
std::string format_utc(TimestampNs t, const std::string& strftime_format);

// Per-run values that parameterize chunk addresses.
// chunk_number starts at 1 and only ever moves forward by one (advance()).
class RotationContext {
 public:
  explicit RotationContext(JobIdentity identity,
                           std::string timestamp_format = kDefaultTimestampFormat,
                           WallClock clock = system_wall_now);

  // Fresh map on every call; `timestamp` is re-rendered from the clock each time.
  UriParams build_parameters() const;

  void advance() { ++chunk_number_; }

  TimestampNs now() const { return clock_(); }

  std::int64_t chunk_number() const { return chunk_number_; }
  const JobIdentity& identity() const { return identity_; }
  const std::string& timestamp_format() const { return timestamp_format_; }

 private:
  JobIdentity identity_;
  std::string timestamp_format_;
  WallClock clock_;
  std::int64_t chunk_number_{1};
};

}  // namespace cx
