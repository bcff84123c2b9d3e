// File: src/adapters/synth/synth_record_source.cpp
#include "cx/adapters/synth/synth_record_source.hpp"

#include <utility>

namespace cx {

SynthRecordSource::SynthRecordSource(SynthSourceConfig cfg) : cfg_(std::move(cfg)) {}

Status SynthRecordSource::next(Record* out) {
  if (!out) return Status::invalid_argument("SynthRecordSource::next: out is null");
  if (next_id_ > cfg_.count) return Status::out_of_range("eof");

  out->fields.clear();
  out->set("id", next_id_);

  ++next_id_;
  return Status::ok_status();
}

}  // namespace cx
