// File: src/core/util/repro_hash.cpp
#include "cx/core/util/repro_hash.hpp"

#include <cstdint>
#include <string>

namespace cx {
namespace {

// FNV-1a 64-bit. Not cryptographic; a fast, stable fingerprint.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  // Feed.
  h.add_string(cfg.feed.uri);
  h.add_string(cfg.feed.format);
  h.add_bool(cfg.feed.items_per_chunk.has_value());
  h.add_i64(cfg.feed.items_per_chunk.value_or(0));
  h.add_string(cfg.feed.timestamp_format);

  // Job identity.
  h.add_string(cfg.job.job_id);
  h.add_string(cfg.job.project);
  h.add_string(cfg.job.project_id);

  // Input.
  h.add_string(cfg.input.type);
  h.add_i64(cfg.input.synth.count);
  h.add_string(cfg.input.lines.path);

  // Output.
  h.add_string(cfg.output.events_dir);

  return to_hex(h.h);
}

}  // namespace cx
