// File: include/cx/core/util/repro_hash.hpp
#pragma once

#include <string>

#include "cx/core/config.hpp"

namespace cx {

// Hash the full runtime config (feed, job identity, input, output).
// Goal: if the run changes, this hash should change.
std::string compute_config_hash(const Config& cfg);

}  // namespace cx
