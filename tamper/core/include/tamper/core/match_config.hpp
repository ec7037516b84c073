#pragma once

#include "engine_config.hpp"
#include "match_criteria.hpp"
#include "result.hpp"

#include <string>

namespace tamper {

// Textual match filters as they arrive from the command line or a settings
// file. List fields are comma separated; empty strings mean "not set".
struct match_settings {
    std::string codes;
    std::string lines;
    std::string words;
    std::string sizes;
    std::string regex;
    bool match_input = false;
};

// Validates every field: codes must be three digits or an NXX class, counts
// must be 64-bit integers (invalid_match_config) and the regex must compile
// (invalid_regex).
[[nodiscard]] result<match_criteria>
build_match_criteria(const match_settings& settings,
                     const engine_config& cfg = default_engine_config());

} // namespace tamper
