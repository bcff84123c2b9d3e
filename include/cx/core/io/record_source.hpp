// File: include/cx/core/io/record_source.hpp
#pragma once

#include <string>

#include "cx/core/status.hpp"
#include "cx/core/types.hpp"

namespace cx {

class RecordSource {
 public:
  virtual ~RecordSource() = default;

  // Returns:
  //  - OK on success and fills `out`
  //  - out_of_range("eof") when no more records
  //  - other error codes on failure
  virtual Status next(Record* out) = 0;

  virtual std::string name() const = 0;
};

}  // namespace cx
