// File: include/cx/core/sinks/chunk_sink.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "cx/core/status.hpp"
#include "cx/core/types.hpp"

namespace cx {

// One open chunk. Owned by whoever opened it, for exactly one rotation interval.
class ChunkSink {
 public:
  virtual ~ChunkSink() = default;

  // sink_write_error on serialization / IO failure, invalid_state after close().
  virtual Status write(const Record& record) = 0;

  // Finalizes the chunk and returns the number of records written.
  // A second call fails with invalid_state.
  virtual Result<std::int64_t> close() = 0;

  virtual const std::string& address() const = 0;
};

// Opens chunk sinks. sink_open_error on a bad address, unknown format or
// unwritable destination.
class ChunkSinkFactory {
 public:
  virtual ~ChunkSinkFactory() = default;

  virtual Result<std::unique_ptr<ChunkSink>> open(const std::string& address,
                                                  const std::string& format) = 0;
};

}  // namespace cx
