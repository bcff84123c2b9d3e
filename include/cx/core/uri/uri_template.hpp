// File: include/cx/core/uri/uri_template.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "cx/core/status.hpp"

namespace cx {

using UriValue = std::variant<std::int64_t, std::string>;
using UriParams = std::map<std::string, UriValue>;

// Placeholder names an address template may reference.
inline constexpr const char* kUriChunkNumber = "chunk_number";
inline constexpr const char* kUriJobId = "job_id";
inline constexpr const char* kUriProjectId = "project_id";
inline constexpr const char* kUriTimestamp = "timestamp";

// A parsed address template.
//
// Syntax is printf-style with named placeholders:
//   %(name)[flags][width][.precision]conv
// flags: any of "-0+ ", conv: d | i | s. "%%" is a literal '%'.
//
//   "out/export_%(chunk_number)02d.json"  -> "out/export_07.json"
//   "s3://bucket/%(job_id)s/%(timestamp)s" -> "s3://bucket/1_2_3/2024-01-31-09"
//
// compile() rejects unknown names and malformed placeholders, so a template
// that compiles can only fail to render on missing or mistyped parameters.
class UriTemplate {
 public:
  static Result<UriTemplate> compile(const std::string& text);

  Result<std::string> render(const UriParams& params) const;

  const std::string& text() const { return text_; }

  // Names referenced by the template, in order of appearance (may repeat).
  std::vector<std::string> placeholder_names() const;

 private:
  struct Segment {
    bool is_placeholder = false;
    std::string literal;  // literal text, or the placeholder name
    std::string flags;
    int width = -1;
    int precision = -1;
    char conv = 's';
  };

  UriTemplate() = default;

  std::string text_;
  std::vector<Segment> segments_;
};

// One-shot helper: compile + render.
Result<std::string> resolve_uri(const std::string& text, const UriParams& params);

bool is_recognized_uri_param(const std::string& name);

}  // namespace cx
