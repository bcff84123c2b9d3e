// File: include/cx/adapters/synth/synth_record_source.hpp
#pragma once

#include <cstdint>
#include <string>

#include "cx/core/io/record_source.hpp"

namespace cx {

struct SynthSourceConfig {
  std::int64_t count{100};  // records {"id": 1} .. {"id": count}
};

class SynthRecordSource final : public RecordSource {
 public:
  explicit SynthRecordSource(SynthSourceConfig cfg);

  Status next(Record* out) override;

  std::string name() const override { return "synth"; }

  std::int64_t emitted() const { return next_id_ - 1; }

 private:
  SynthSourceConfig cfg_;
  std::int64_t next_id_{1};
};

}  // namespace cx
