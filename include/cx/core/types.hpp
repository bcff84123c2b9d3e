// include/cx/core/types.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace cx {

// -----------------------------
// Basic identifiers
// -----------------------------

using JobId = std::string;      // e.g. "123/4/56"
using ProjectId = std::string;  // e.g. "123"

// -----------------------------
// Time
// -----------------------------
// Timestamps are integer nanoseconds since the Unix epoch (UTC).

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
};

// -----------------------------
// Records
// -----------------------------

using FieldValue = std::variant<std::int64_t, double, std::string>;

// One produced item. Field order is preserved; sinks serialize in this order.
struct Record {
  std::vector<std::pair<std::string, FieldValue>> fields;

  Record& set(std::string name, FieldValue value) {
    fields.emplace_back(std::move(name), std::move(value));
    return *this;
  }

  [[nodiscard]] const FieldValue* find(const std::string& name) const noexcept {
    for (const auto& f : fields) {
      if (f.first == name) return &f.second;
    }
    return nullptr;
  }

  [[nodiscard]] std::size_t size() const noexcept { return fields.size(); }
  [[nodiscard]] bool empty() const noexcept { return fields.empty(); }
};

}  // namespace cx
