#include "tamper/core/cycle_detector.hpp"
#include "tamper/core/serde.hpp"

#include <vector>

namespace tamper {

namespace {

// Keeps empty segments, so "a##" has three.
std::vector<std::string_view> split_chain(std::string_view chain) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t hash = chain.find('#', start);
        if (hash == std::string_view::npos) {
            parts.push_back(chain.substr(start));
            break;
        }
        parts.push_back(chain.substr(start, hash - start));
        start = hash + 1;
    }
    return parts;
}

} // namespace

bool is_cyclic_chain(std::string_view chain, size_t depth) {
    auto parts = split_chain(chain);
    if (parts.size() < depth) {
        return false;
    }
    // Chains are bounded by schema nesting, the quadratic scan stays small.
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        for (size_t j = i + 1; j < parts.size(); ++j) {
            if (serde::iequals(parts[i], parts[j])) {
                return true;
            }
        }
    }
    return false;
}

} // namespace tamper
