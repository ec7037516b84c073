#pragma once

#include <cstddef>
#include <string_view>

namespace tamper {

// `chain` is a '#'-joined property traversal such as "pet#owner#pet".
// Chains with fewer than `depth` segments are never reported; otherwise any
// case-insensitive repeat of a segment makes the chain cyclic.
[[nodiscard]] bool is_cyclic_chain(std::string_view chain, size_t depth);

} // namespace tamper
