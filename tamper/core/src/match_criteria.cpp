#include "tamper/core/match_criteria.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace tamper {

namespace {

template <typename T> bool configured(const std::optional<std::vector<T>>& values) noexcept {
    return values.has_value() && !values->empty();
}

bool contains(const std::optional<std::vector<int64_t>>& values, int64_t n) noexcept {
    return configured(values) && std::find(values->begin(), values->end(), n) != values->end();
}

template <typename T> std::string list_text(const std::vector<T>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

bool is_x(char c) noexcept {
    return c == 'x' || c == 'X';
}

} // namespace

bool is_code_class(std::string_view pattern) noexcept {
    return pattern.size() == 3 && pattern[0] >= '2' && pattern[0] <= '9' && is_x(pattern[1]) &&
           is_x(pattern[2]);
}

match_criteria::match_criteria(fields f) : fields_(std::move(f)) {
    if (fields_.regex && !fields_.regex->empty()) {
        try {
            compiled_.emplace(*fields_.regex, boost::regex::ECMAScript);
        } catch (const boost::regex_error&) {
            compiled_.reset(); // reported by build_match_criteria, matches nothing here
        }
    }
}

bool match_criteria::is_any_criterion_configured() const noexcept {
    return configured(fields_.codes) || configured(fields_.lines) || configured(fields_.words) ||
           configured(fields_.sizes) || (fields_.regex && !fields_.regex->empty());
}

bool match_criteria::matches_code(std::string_view code) const {
    if (!configured(fields_.codes) || code.empty()) {
        return false;
    }
    return std::any_of(fields_.codes->begin(), fields_.codes->end(), [&](const std::string& p) {
        return p == code || (is_code_class(p) && code.front() == p.front());
    });
}

bool match_criteria::matches_lines(int64_t lines) const noexcept {
    return contains(fields_.lines, lines);
}

bool match_criteria::matches_words(int64_t words) const noexcept {
    return contains(fields_.words, words);
}

bool match_criteria::matches_sizes(int64_t bytes) const noexcept {
    return contains(fields_.sizes, bytes);
}

bool match_criteria::matches_regex(std::string_view text) const {
    if (!compiled_) {
        return false;
    }
    // The perl matcher keeps its backtrack state on the heap and throws once
    // the state budget for this input length is spent.
    try {
        return boost::regex_match(text.begin(), text.end(), *compiled_);
    } catch (const std::runtime_error&) {
        return false;
    }
}

bool match_criteria::is_input_reflected(const response_descriptor& response,
                                        std::string_view value) const {
    return fields_.match_input && response.body.find(value) != std::string::npos;
}

bool match_criteria::evaluate(const response_descriptor& response) const {
    if (!is_any_criterion_configured()) {
        return false;
    }
    if (configured(fields_.codes) && !matches_code(std::to_string(response.status))) {
        return false;
    }
    if (fields_.regex && !fields_.regex->empty() && !matches_regex(response.body)) {
        return false;
    }
    if (configured(fields_.lines) && !matches_lines(response.lines)) {
        return false;
    }
    if (configured(fields_.words) && !matches_words(response.words)) {
        return false;
    }
    if (configured(fields_.sizes) && !matches_sizes(response.bytes)) {
        return false;
    }
    return true;
}

std::string match_criteria::describe() const {
    std::vector<std::string> clauses;
    if (configured(fields_.codes)) {
        clauses.push_back(" response codes: " + list_text(*fields_.codes));
    }
    if (fields_.regex && !fields_.regex->empty()) {
        clauses.push_back(" regex: " + *fields_.regex);
    }
    if (configured(fields_.lines)) {
        clauses.push_back(" number of lines: " + list_text(*fields_.lines));
    }
    if (configured(fields_.words)) {
        clauses.push_back(" number of words: " + list_text(*fields_.words));
    }
    if (configured(fields_.sizes)) {
        clauses.push_back(" response sizes: " + list_text(*fields_.sizes));
    }
    std::string out;
    for (size_t i = 0; i < clauses.size(); ++i) {
        if (i != 0) {
            out.push_back(',');
        }
        out += clauses[i];
    }
    return out;
}

} // namespace tamper
