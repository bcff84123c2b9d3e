// File: include/cx/core/util/text_encoding.hpp
#pragma once

#include <string>

#include "cx/core/types.hpp"

namespace cx {

// JSON string body escaping (no surrounding quotes).
std::string json_escape(const std::string& s);

// A field value as a JSON literal. Non-finite doubles become null.
std::string json_value(const FieldValue& v);

// {"a":1,"b":"x"} in field order.
std::string record_to_json(const Record& r);

// Plain text rendering used by CSV cells.
std::string field_to_text(const FieldValue& v);

// Quotes a CSV cell when it contains a separator, quote or line break.
std::string csv_escape(const std::string& s);

}  // namespace cx
