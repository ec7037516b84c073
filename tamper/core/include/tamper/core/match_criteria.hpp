#pragma once

#include "response.hpp"

#include <cstdint>
#include <boost/regex.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tamper {

// User-declared response filters for one fuzzing session. Built once from
// configuration and then only read, so a single instance can be shared by
// every worker without locking.
class match_criteria {
public:
    struct fields {
        std::optional<std::vector<std::string>> codes; // "404", or classes such as "4XX"
        std::optional<std::vector<int64_t>> lines;
        std::optional<std::vector<int64_t>> words;
        std::optional<std::vector<int64_t>> sizes;
        std::optional<std::string> regex; // full-body match, Perl/ECMAScript grammar
        bool match_input = false;
    };

    match_criteria() = default;
    explicit match_criteria(fields f);

    [[nodiscard]] const fields& settings() const noexcept { return fields_; }

    // match_input alone does not count as a configured criterion.
    [[nodiscard]] bool is_any_criterion_configured() const noexcept;

    [[nodiscard]] bool matches_code(std::string_view code) const;
    [[nodiscard]] bool matches_lines(int64_t lines) const noexcept;
    [[nodiscard]] bool matches_words(int64_t words) const noexcept;
    [[nodiscard]] bool matches_sizes(int64_t bytes) const noexcept;
    // A pattern that does not compile, or cannot be evaluated, never matches.
    [[nodiscard]] bool matches_regex(std::string_view text) const;

    [[nodiscard]] bool is_input_reflected(const response_descriptor& response,
                                          std::string_view value) const;

    // False when nothing is configured, otherwise the conjunction of every
    // configured criterion; unconfigured ones do not take part.
    [[nodiscard]] bool evaluate(const response_descriptor& response) const;

    // " response codes: [..], regex: .., number of lines: [..], ..." for the
    // configured criteria, empty when there are none.
    [[nodiscard]] std::string describe() const;

private:
    fields fields_;
    std::optional<boost::regex> compiled_;
};

// True for a "NXX" response code class pattern with N in 2..9.
[[nodiscard]] bool is_code_class(std::string_view pattern) noexcept;

} // namespace tamper
