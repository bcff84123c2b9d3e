// File: src/core/model/chunk_rotator.cpp
#include "cx/core/model/chunk_rotator.hpp"

#include <utility>

namespace cx {

const char* to_string(ChunkRotator::State s) {
  switch (s) {
    case ChunkRotator::State::kIdle: return "idle";
    case ChunkRotator::State::kOpen: return "open";
    case ChunkRotator::State::kClosed: return "closed";
  }
  return "unknown";
}

ChunkRotator::ChunkRotator(FeedConfig feed, RotationContext context, ChunkSinkFactory& sinks,
                           EventSink* events)
    : feed_(std::move(feed)), context_(std::move(context)), sinks_(sinks), events_(events) {}

ChunkRotator::~ChunkRotator() {
  if (state_ != State::kOpen) return;
  state_ = State::kClosed;
  // A destructor has no caller to report to; the sink is released either way.
  static_cast<void>(close_chunk_());
}

Status ChunkRotator::start() {
  if (state_ != State::kIdle) {
    return Status::invalid_state(std::string("ChunkRotator::start called in state ") +
                                 to_string(state_));
  }

  CX_RETURN_IF_ERROR(validate_feed_config(feed_));

  auto uri_r = UriTemplate::compile(feed_.uri);
  if (!uri_r.ok()) return uri_r.status();
  uri_ = uri_r.take_value();

  CX_RETURN_IF_ERROR(open_chunk_());
  state_ = State::kOpen;
  return Status::ok_status();
}

Status ChunkRotator::submit(const Record& record) {
  if (state_ != State::kOpen) {
    return Status::invalid_state(std::string("ChunkRotator::submit called in state ") +
                                 to_string(state_));
  }

  // Rotate before handling the record that would overflow the chunk.
  if (items_in_chunk_ >= *feed_.items_per_chunk) {
    CX_RETURN_IF_ERROR(rotate_());
  }

  CX_RETURN_IF_ERROR(sink_->write(record));
  ++items_in_chunk_;
  ++total_items_;
  return Status::ok_status();
}

Status ChunkRotator::finish() {
  if (state_ != State::kOpen) {
    return Status::invalid_state(std::string("ChunkRotator::finish called in state ") +
                                 to_string(state_));
  }
  state_ = State::kClosed;
  return close_chunk_();
}

Status ChunkRotator::open_chunk_() {
  auto addr_r = uri_->render(context_.build_parameters());
  if (!addr_r.ok()) return addr_r.status();

  auto sink_r = sinks_.open(addr_r.value(), feed_.format);
  if (!sink_r.ok()) return sink_r.status();

  sink_ = sink_r.take_value();
  current_address_ = addr_r.take_value();
  items_in_chunk_ = 0;

  emit_("chunk_opened", -1);
  return Status::ok_status();
}

// Always releases the sink, even when close() reports an error.
Status ChunkRotator::close_chunk_() {
  std::unique_ptr<ChunkSink> sink = std::move(sink_);
  auto closed_r = sink->close();
  sink.reset();
  if (!closed_r.ok()) return closed_r.status();

  chunks_.push_back(ChunkSummary{context_.chunk_number(), current_address_, closed_r.value()});
  emit_("chunk_closed", closed_r.value());
  return Status::ok_status();
}

Status ChunkRotator::rotate_() {
  const Status closed = close_chunk_();
  if (!closed.ok()) {
    state_ = State::kClosed;
    return closed;
  }

  context_.advance();

  const Status opened = open_chunk_();
  if (!sink_) state_ = State::kClosed;
  return opened;
}

void ChunkRotator::emit_(const std::string& type, std::int64_t items) {
  if (!events_) return;

  Event e;
  e.type = type;
  e.t_wall = context_.now();
  e.chunk_number = context_.chunk_number();
  e.address = current_address_;
  e.items = items;
  const Status st = events_->emit(e);
  if (!st.ok() && event_status_.ok()) event_status_ = st;
}

}  // namespace cx
