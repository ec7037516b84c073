#pragma once

#include "engine_config.hpp"

#include <set>
#include <string>
#include <string_view>

namespace tamper {

// Textual probe for an inlined oneOf/anyOf grouping in a serialized payload.
inline constexpr std::string_view union_marker = "_OF";

struct union_request {
    std::string target_path;     // path-query of the slot to fill, "$" for the root
    std::string alternative_key; // variant key to promote when the slot is absent
    std::string new_value;       // pre-serialized JSON (permissive grammar)
    std::set<std::string> eliminate_keys;
};

// Puts `new_value` at `target_path`. When the slot does not exist and the
// payload carries the union marker, the `alternative_key` sibling is renamed
// to the slot name and every `eliminate_keys` sibling is deleted instead.
// Never fails: every problem degrades to the best payload reached so far.
[[nodiscard]] std::string resolve_union(std::string_view payload,
                                        const union_request& request,
                                        const engine_config& cfg = default_engine_config());

} // namespace tamper
