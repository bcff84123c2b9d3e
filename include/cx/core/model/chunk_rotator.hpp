// File: include/cx/core/model/chunk_rotator.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cx/core/config.hpp"
#include "cx/core/events/event_sink.hpp"
#include "cx/core/model/rotation_context.hpp"
#include "cx/core/sinks/chunk_sink.hpp"
#include "cx/core/status.hpp"
#include "cx/core/types.hpp"
#include "cx/core/uri/uri_template.hpp"

namespace cx {

struct ChunkSummary {
  std::int64_t chunk_number = 0;
  std::string address;
  std::int64_t items = 0;
};

// ChunkRotator owns the currently open chunk sink and decides when to rotate.
//
// State machine:
//   kIdle --start()--> kOpen --finish()--> kClosed
//
// Rotation is purely count driven: the record that would overflow the current
// chunk first closes it, advances the context's chunk number and opens the
// next chunk, then lands in that new chunk. Chunks are therefore full except
// the last one. There is no timer and no background thread.
//
// start() opens the first chunk eagerly, so a run with zero records still
// produces exactly one (empty) chunk.
//
// Failure contract:
//  - a failed write keeps the chunk open; finish() must still be called
//  - a failed rotation leaves no sink open and moves to kClosed
//  - destruction closes a sink the caller never finished (best effort)
//  - a failed event emit never fails a rotator call; the first such error is
//    kept in event_status()
class ChunkRotator {
 public:
  enum class State { kIdle, kOpen, kClosed };

  // `sinks` and `events` must outlive the rotator. `events` may be null.
  ChunkRotator(FeedConfig feed, RotationContext context, ChunkSinkFactory& sinks,
               EventSink* events = nullptr);

  ~ChunkRotator();

  ChunkRotator(const ChunkRotator&) = delete;
  ChunkRotator& operator=(const ChunkRotator&) = delete;

  Status start();
  Status submit(const Record& record);
  Status finish();

  State state() const { return state_; }
  std::int64_t chunk_number() const { return context_.chunk_number(); }
  std::int64_t items_in_current_chunk() const { return items_in_chunk_; }
  std::int64_t total_items() const { return total_items_; }
  const std::string& current_address() const { return current_address_; }

  // Closed chunks, in order.
  const std::vector<ChunkSummary>& chunks() const { return chunks_; }

  const RotationContext& context() const { return context_; }

  // OK unless an event emit failed.
  const Status& event_status() const { return event_status_; }

 private:
  Status open_chunk_();
  Status close_chunk_();
  Status rotate_();
  void emit_(const std::string& type, std::int64_t items);

  FeedConfig feed_;
  RotationContext context_;
  ChunkSinkFactory& sinks_;
  EventSink* events_;

  std::optional<UriTemplate> uri_;
  State state_{State::kIdle};

  std::unique_ptr<ChunkSink> sink_;
  std::string current_address_;
  std::int64_t items_in_chunk_{0};
  std::int64_t total_items_{0};

  std::vector<ChunkSummary> chunks_;
  Status event_status_;
};

const char* to_string(ChunkRotator::State s);

}  // namespace cx
