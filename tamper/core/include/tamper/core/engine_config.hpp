#pragma once

#include "json_parser.hpp"
#include "trace.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace tamper {

// Parser grammars and the diagnostic sink shared by every payload operation.
// Built once at startup and passed by const reference; never mutated after.
struct engine_config {
    json::parse_options strict{json::grammar::strict};
    json::parse_options permissive{json::grammar::permissive};
    trace_handler trace;

    void emit(std::string_view component, std::string message) const {
        if (trace) {
            trace(trace_event{component, std::move(message)});
        }
    }
};

// Strict/permissive grammars with default limits and no trace handler.
const engine_config& default_engine_config();

} // namespace tamper
