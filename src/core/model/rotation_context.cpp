// File: src/core/model/rotation_context.cpp
#include "cx/core/model/rotation_context.hpp"

#include <chrono>
#include <ctime>
#include <utility>

namespace cx {

TimestampNs system_wall_now() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now().time_since_epoch();
  const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  return TimestampNs{static_cast<std::int64_t>(ns)};
}

std::string format_utc(TimestampNs t, const std::string& strftime_format) {
  // Floor toward -inf so pre-epoch times land in the right second.
  std::int64_t secs = t.ns / 1'000'000'000;
  if (t.ns < 0 && t.ns % 1'000'000'000 != 0) --secs;
  const std::time_t tt = static_cast<std::time_t>(secs);

  std::tm tm_buf{};
  ::gmtime_r(&tt, &tm_buf);

  // strftime returns 0 both on overflow and on an empty result; grow a few times.
  std::size_t cap = 64 + strftime_format.size() * 4;
  for (int attempt = 0; attempt < 4; ++attempt) {
    std::string buf(cap, '\0');
    const std::size_t n = std::strftime(buf.data(), buf.size(), strftime_format.c_str(), &tm_buf);
    if (n > 0) {
      buf.resize(n);
      return buf;
    }
    cap *= 4;
  }
  return std::string();
}

RotationContext::RotationContext(JobIdentity identity, std::string timestamp_format,
                                 WallClock clock)
    : identity_(std::move(identity)),
      timestamp_format_(std::move(timestamp_format)),
      clock_(clock ? std::move(clock) : WallClock(system_wall_now)) {}

UriParams RotationContext::build_parameters() const {
  UriParams p;
  p[kUriChunkNumber] = chunk_number_;
  p[kUriJobId] = identity_.job_id;
  p[kUriProjectId] = identity_.project_id;
  p[kUriTimestamp] = format_utc(clock_(), timestamp_format_);
  return p;
}

}  // namespace cx
