#include "tamper/core/fuzz_strategy.hpp"
#include "tamper/core/match_config.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

// Runs one field fuzzer over a payload and classifies canned responses the
// way a fuzzing session would after each request.
int main() {
    tamper::engine_config cfg;
    cfg.trace = tamper::stderr_trace_handler();

    const std::string payload =
        R"({"name":"rex","tags":["good","boy"],"owner":{"phones":["555"],"age":7}})";
    const std::vector<std::string> fields = {"name", "tags", "owner#phones", "owner#age"};

    tamper::match_settings settings;
    settings.codes = "2XX,500";
    auto criteria = tamper::build_match_criteria(settings, cfg);
    if (!criteria) {
        std::cerr << "[example] " << criteria.error().message() << "\n";
        return 1;
    }

    tamper::replace_arrays_with_primitives strategy(cfg);
    std::cout << strategy.name() << ": " << strategy.description() << "\n";

    int32_t status = 200;
    for (const auto& field : fields) {
        for (const auto& mutated : strategy.mutate(payload, field)) {
            // An API that accepts a string in place of an array is worth reporting.
            auto response = tamper::response_descriptor::from_body(status, R"({"id":1})");
            std::cout << "  " << field << " -> " << mutated << "\n";
            std::cout << "    " << response.status << " "
                      << (criteria->evaluate(response) ? "reported" : "expected") << ","
                      << criteria->describe() << "\n";
            status = status == 200 ? 400 : 200;
        }
    }

    tamper::random_string_body body(48);
    std::cout << body.scenario() << ": " << body.payload() << "\n";
    return 0;
}
