#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace tamper {

struct trace_event {
    std::string_view component;
    std::string message;
};

using trace_handler = std::function<void(const trace_event&)>;

// Writes "[component] message" lines to std::cerr.
trace_handler stderr_trace_handler();

} // namespace tamper
