#pragma once

#include "json_value.hpp"
#include "result.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tamper::json {

enum class grammar : uint8_t {
    strict,     // RFC 8259, any value at top level
    permissive, // single quotes, unquoted keys and scalars, trailing commas
};

struct parse_options {
    grammar mode = grammar::strict;
    size_t max_depth = 512;
};

// Parses `text` into a tree. Every syntax problem, including nesting deeper
// than `max_depth`, is reported as error_code::malformed_json.
[[nodiscard]] result<json_value> parse(std::string_view text, const parse_options& opts = {});

} // namespace tamper::json
