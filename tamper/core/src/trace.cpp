#include "tamper/core/engine_config.hpp"
#include "tamper/core/trace.hpp"

#include <iostream>

namespace tamper {

trace_handler stderr_trace_handler() {
    return [](const trace_event& ev) {
        std::cerr << "[" << ev.component << "] " << ev.message << "\n";
    };
}

const engine_config& default_engine_config() {
    static engine_config const instance;
    return instance;
}

} // namespace tamper
