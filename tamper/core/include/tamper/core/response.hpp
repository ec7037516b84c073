#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tamper {

// Summary of one completed HTTP exchange, produced by the executor.
struct response_descriptor {
    int32_t status = 0;
    std::string body;
    int64_t lines = 0;
    int64_t words = 0;
    int64_t bytes = 0;

    // Counts are derived from `body`: lines as separated by '\n' (a trailing
    // newline does not open another line), words as whitespace-separated
    // tokens, bytes as the raw length.
    [[nodiscard]] static response_descriptor from_body(int32_t status, std::string body);
};

[[nodiscard]] int64_t count_lines(std::string_view body) noexcept;
[[nodiscard]] int64_t count_words(std::string_view body) noexcept;

} // namespace tamper
