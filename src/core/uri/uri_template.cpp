// File: src/core/uri/uri_template.cpp
#include "cx/core/uri/uri_template.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace cx {
namespace {

constexpr int kMaxFieldWidth = 255;

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_flag(char c) { return c == '-' || c == '0' || c == '+' || c == ' '; }

// Parses a run of digits starting at `i`; advances `i`. Returns -1 if none.
int parse_number(const std::string& s, std::size_t& i) {
  if (i >= s.size() || !is_digit(s[i])) return -1;
  int v = 0;
  while (i < s.size() && is_digit(s[i])) {
    v = v * 10 + (s[i] - '0');
    if (v > kMaxFieldWidth) return kMaxFieldWidth + 1;
    ++i;
  }
  return v;
}

std::string pad(std::string s, int width, bool left) {
  if (width < 0 || static_cast<int>(s.size()) >= width) return s;
  const std::string fill(static_cast<std::size_t>(width) - s.size(), ' ');
  return left ? s + fill : fill + s;
}

std::string format_integer(std::int64_t v, const std::string& flags, int width, int precision) {
  std::string fmt = "%" + flags;
  if (width >= 0) fmt += std::to_string(width);
  if (precision >= 0) fmt += "." + std::to_string(precision);
  fmt += "lld";

  const long long lv = static_cast<long long>(v);
  const int n = std::snprintf(nullptr, 0, fmt.c_str(), lv);
  if (n <= 0) return std::string();
  std::string out(static_cast<std::size_t>(n) + 1, '\0');
  std::snprintf(out.data(), out.size(), fmt.c_str(), lv);
  out.resize(static_cast<std::size_t>(n));
  return out;
}

}  // namespace

bool is_recognized_uri_param(const std::string& name) {
  return name == kUriChunkNumber || name == kUriJobId || name == kUriProjectId ||
         name == kUriTimestamp;
}

Result<UriTemplate> UriTemplate::compile(const std::string& text) {
  UriTemplate t;
  t.text_ = text;

  std::string literal;
  auto flush_literal = [&]() {
    if (literal.empty()) return;
    Segment seg;
    seg.literal = std::move(literal);
    t.segments_.push_back(std::move(seg));
    literal.clear();
  };

  std::size_t i = 0;
  const std::size_t n = text.size();
  while (i < n) {
    const char c = text[i];
    if (c != '%') {
      literal.push_back(c);
      ++i;
      continue;
    }

    if (i + 1 >= n) {
      return Result<UriTemplate>::err(
          Status::template_error("dangling '%' at end of uri template: " + text));
    }
    if (text[i + 1] == '%') {
      literal.push_back('%');
      i += 2;
      continue;
    }
    if (text[i + 1] != '(') {
      return Result<UriTemplate>::err(Status::template_error(
          "positional placeholder at offset " + std::to_string(i) +
          " in uri template (use %(name)conv): " + text));
    }

    const std::size_t close = text.find(')', i + 2);
    if (close == std::string::npos) {
      return Result<UriTemplate>::err(
          Status::template_error("unterminated '%(' in uri template: " + text));
    }

    Segment seg;
    seg.is_placeholder = true;
    seg.literal = text.substr(i + 2, close - (i + 2));
    if (seg.literal.empty()) {
      return Result<UriTemplate>::err(
          Status::template_error("empty placeholder name in uri template: " + text));
    }
    if (!is_recognized_uri_param(seg.literal)) {
      return Result<UriTemplate>::err(Status::template_error(
          "unknown uri placeholder '" + seg.literal + "' in: " + text));
    }

    std::size_t j = close + 1;
    while (j < n && is_flag(text[j])) seg.flags.push_back(text[j++]);
    seg.width = parse_number(text, j);
    if (j < n && text[j] == '.') {
      ++j;
      seg.precision = parse_number(text, j);
      if (seg.precision < 0) seg.precision = 0;
    }
    if (seg.width > kMaxFieldWidth || seg.precision > kMaxFieldWidth) {
      return Result<UriTemplate>::err(Status::template_error(
          "field width too large for placeholder '" + seg.literal + "'"));
    }
    // A length modifier (h, l, L) is accepted and has no effect.
    if (j < n && (text[j] == 'h' || text[j] == 'l' || text[j] == 'L')) ++j;
    if (j >= n) {
      return Result<UriTemplate>::err(Status::template_error(
          "missing conversion for placeholder '" + seg.literal + "'"));
    }
    seg.conv = text[j];
    if (seg.conv != 'd' && seg.conv != 'i' && seg.conv != 's') {
      return Result<UriTemplate>::err(Status::template_error(
          std::string("unsupported conversion '") + seg.conv + "' for placeholder '" +
          seg.literal + "'"));
    }

    flush_literal();
    t.segments_.push_back(std::move(seg));
    i = j + 1;
  }
  flush_literal();

  return Result<UriTemplate>::ok(std::move(t));
}

Result<std::string> UriTemplate::render(const UriParams& params) const {
  std::string out;
  out.reserve(text_.size() + 16);

  for (const auto& seg : segments_) {
    if (!seg.is_placeholder) {
      out += seg.literal;
      continue;
    }

    const auto it = params.find(seg.literal);
    if (it == params.end()) {
      return Result<std::string>::err(
          Status::template_error("missing value for uri placeholder '" + seg.literal + "'"));
    }

    const bool left = seg.flags.find('-') != std::string::npos;

    if (seg.conv == 'd' || seg.conv == 'i') {
      const auto* iv = std::get_if<std::int64_t>(&it->second);
      if (!iv) {
        return Result<std::string>::err(Status::template_error(
            "uri placeholder '" + seg.literal + "' expects an integer"));
      }
      out += format_integer(*iv, seg.flags, seg.width, seg.precision);
      continue;
    }

    // %s: integers render in decimal, '0' flag is ignored.
    std::string s;
    if (const auto* iv = std::get_if<std::int64_t>(&it->second)) {
      s = std::to_string(*iv);
    } else {
      s = std::get<std::string>(it->second);
    }
    if (seg.precision >= 0 && static_cast<int>(s.size()) > seg.precision) {
      s.resize(static_cast<std::size_t>(seg.precision));
    }
    out += pad(std::move(s), seg.width, left);
  }

  return Result<std::string>::ok(std::move(out));
}

std::vector<std::string> UriTemplate::placeholder_names() const {
  std::vector<std::string> names;
  for (const auto& seg : segments_) {
    if (seg.is_placeholder) names.push_back(seg.literal);
  }
  return names;
}

Result<std::string> resolve_uri(const std::string& text, const UriParams& params) {
  auto t = UriTemplate::compile(text);
  if (!t.ok()) return Result<std::string>::err(t.status());
  return t->render(params);
}

}  // namespace cx
