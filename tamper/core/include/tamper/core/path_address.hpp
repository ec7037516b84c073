#pragma once

#include <string>
#include <string_view>

namespace tamper::path {

// Addresses the first element of a document whose root is an array.
inline constexpr std::string_view first_element_prefix = "$[0]#";
// Addresses every element of a document whose root is an array.
inline constexpr std::string_view all_elements_prefix = "$[*]#";

// Field paths use '#' as an alias for '.'; the result is a path-query.
[[nodiscard]] std::string sanitize(std::string_view path);

[[nodiscard]] bool is_root_array_prefixed(std::string_view path) noexcept;
[[nodiscard]] std::string prefix_first_element(std::string_view path);
[[nodiscard]] std::string prefix_all_elements(std::string_view path);

// Bracket-quotes keys containing a blank so they stay valid path-query syntax.
[[nodiscard]] std::string quote_key(std::string_view key);

} // namespace tamper::path
