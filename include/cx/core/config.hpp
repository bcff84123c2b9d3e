// include/cx/core/config.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "cx/core/status.hpp"
#include "cx/core/types.hpp"

namespace cx {

inline constexpr const char* kDefaultTimestampFormat = "%Y-%m-%d-%H";

inline constexpr const char* kNoJob = "nojob";
inline constexpr const char* kNoProject = "noproject";
inline constexpr const char* kNoProjectId = "noprojectid";

// -----------------------------
// Chunked feed (what the rotator consumes)
// -----------------------------
struct FeedConfig {
  // Address template, e.g. "out/export_%(chunk_number)02d.json".
  std::string uri;

  // Sink format handed to the sink factory on every open ("json", "jsonlines", "csv").
  std::string format;

  // Rotation threshold. Unset or <= 0 is a configuration error.
  std::optional<std::int64_t> items_per_chunk;

  // strftime pattern for the `timestamp` uri parameter (rendered in UTC).
  std::string timestamp_format = kDefaultTimestampFormat;
};

// -----------------------------
// Job identity
// -----------------------------
// Empty fields are filled from the environment by the config loader, then from
// the sentinels above. The core only ever sees resolved values.
struct JobConfig {
  JobId job_id;
  std::string project;
  ProjectId project_id;
};

// -----------------------------
// Record source
// -----------------------------
struct InputSynthConfig {
  std::int64_t count = 100;
};

struct InputLinesConfig {
  std::string path;
};

struct InputConfig {
  std::string type = "synth";  // synth | lines
  InputSynthConfig synth;
  InputLinesConfig lines;
};

// -----------------------------
// Output (run events)
// -----------------------------
struct OutputConfig {
  // Where to write the run's event JSONL.
  std::string events_dir = "out";
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  FeedConfig feed;
  JobConfig job;
  InputConfig input;
  OutputConfig output;
};

// Everything a rotator needs before it may open its first chunk.
inline Status validate_feed_config(const FeedConfig& feed) {
  if (feed.uri.empty()) {
    return Status::configuration_error("feed.uri must not be empty");
  }
  if (feed.format.empty()) {
    return Status::configuration_error("feed.format must not be empty");
  }
  if (!feed.items_per_chunk.has_value()) {
    return Status::configuration_error("feed.items_per_chunk must be set");
  }
  if (*feed.items_per_chunk <= 0) {
    return Status::configuration_error("feed.items_per_chunk must be > 0");
  }
  if (feed.timestamp_format.empty()) {
    return Status::configuration_error("feed.timestamp_format must not be empty");
  }
  return Status::ok_status();
}

// Minimal validation (keep it strict; fail early).
inline Status validate_config(const Config& cfg) {
  CX_RETURN_IF_ERROR(validate_feed_config(cfg.feed));

  if (cfg.input.type != "synth" && cfg.input.type != "lines") {
    return Status::invalid_argument("input.type must be 'synth' or 'lines'");
  }
  if (cfg.input.type == "synth" && cfg.input.synth.count < 0) {
    return Status::invalid_argument("input.synth.count must be >= 0");
  }
  if (cfg.input.type == "lines" && cfg.input.lines.path.empty()) {
    return Status::invalid_argument("input.lines.path must not be empty for lines input");
  }
  if (cfg.output.events_dir.empty()) {
    return Status::invalid_argument("output.events_dir must not be empty");
  }
  return Status::ok_status();
}

}  // namespace cx
