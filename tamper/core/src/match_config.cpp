#include "tamper/core/match_config.hpp"
#include "tamper/core/serde.hpp"

#include <boost/regex.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <vector>

namespace tamper {

namespace {

constexpr std::string_view match_component = "match";

std::vector<std::string_view> split_list(std::string_view text) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        size_t comma = text.find(',', start);
        out.push_back(serde::trim_view(text.substr(start, comma - start)));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

bool is_status_code(std::string_view entry) noexcept {
    return entry.size() == 3 && std::all_of(entry.begin(), entry.end(), [](char c) {
               return std::isdigit(static_cast<unsigned char>(c)) != 0;
           });
}

result<std::optional<std::vector<std::string>>> parse_codes(std::string_view text,
                                                            const engine_config& cfg) {
    if (serde::is_blank(text)) {
        return std::optional<std::vector<std::string>>{};
    }
    std::vector<std::string> codes;
    for (auto entry : split_list(text)) {
        if (!is_status_code(entry) && !is_code_class(entry)) {
            cfg.emit(match_component, "invalid response code: '" + std::string(entry) + "'");
            return make_unexpected(error_code::invalid_match_config);
        }
        codes.emplace_back(entry);
    }
    return std::optional<std::vector<std::string>>{std::move(codes)};
}

result<std::optional<std::vector<int64_t>>>
parse_counts(std::string_view what, std::string_view text, const engine_config& cfg) {
    if (serde::is_blank(text)) {
        return std::optional<std::vector<int64_t>>{};
    }
    std::vector<int64_t> counts;
    for (auto entry : split_list(text)) {
        int64_t n = 0;
        auto [ptr, ec] = std::from_chars(entry.data(), entry.data() + entry.size(), n);
        if (entry.empty() || ec != std::errc() || ptr != entry.data() + entry.size()) {
            cfg.emit(match_component,
                     "invalid " + std::string(what) + " value: '" + std::string(entry) + "'");
            return make_unexpected(error_code::invalid_match_config);
        }
        counts.push_back(n);
    }
    return std::optional<std::vector<int64_t>>{std::move(counts)};
}

} // namespace

result<match_criteria> build_match_criteria(const match_settings& settings,
                                            const engine_config& cfg) {
    match_criteria::fields fields;

    auto codes = parse_codes(settings.codes, cfg);
    if (!codes) {
        return std::unexpected(codes.error());
    }
    fields.codes = std::move(*codes);

    auto lines = parse_counts("lines", settings.lines, cfg);
    if (!lines) {
        return std::unexpected(lines.error());
    }
    fields.lines = std::move(*lines);

    auto words = parse_counts("words", settings.words, cfg);
    if (!words) {
        return std::unexpected(words.error());
    }
    fields.words = std::move(*words);

    auto sizes = parse_counts("sizes", settings.sizes, cfg);
    if (!sizes) {
        return std::unexpected(sizes.error());
    }
    fields.sizes = std::move(*sizes);

    if (!settings.regex.empty()) {
        try {
            boost::regex probe(settings.regex, boost::regex::ECMAScript);
        } catch (const boost::regex_error& e) {
            cfg.emit(match_component,
                     "invalid regex '" + settings.regex + "': " + std::string(e.what()));
            return make_unexpected(error_code::invalid_regex);
        }
        fields.regex = settings.regex;
    }
    fields.match_input = settings.match_input;

    return match_criteria(std::move(fields));
}

} // namespace tamper
