#include "tamper/core/json_parser.hpp"
#include "tamper/core/serde.hpp"

#include <optional>
#include <string>
#include <utility>

namespace tamper::json {

namespace {

using serde::json_cursor;

std::optional<uint32_t> read_hex4(std::string_view raw, size_t at) noexcept {
    if (at + 4 > raw.size()) {
        return std::nullopt;
    }
    uint32_t value = 0;
    for (size_t i = at; i < at + 4; ++i) {
        char c = raw[i];
        value <<= 4;
        if (c >= '0' && c <= '9') {
            value |= static_cast<uint32_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            value |= static_cast<uint32_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            value |= static_cast<uint32_t>(c - 'A' + 10);
        } else {
            return std::nullopt;
        }
    }
    return value;
}

bool is_structural(char c) noexcept {
    return c == ',' || c == ':' || c == '{' || c == '}' || c == '[' || c == ']';
}

class parser {
public:
    parser(std::string_view text, const parse_options& opts) : cur_(text), opts_(opts) {}

    result<json_value> parse_document() {
        cur_.skip_ws();
        if (cur_.eof()) {
            if (permissive()) {
                return json_value::null_node();
            }
            return fail();
        }
        auto value = parse_value(0);
        if (!value) {
            return value;
        }
        cur_.skip_ws();
        if (!cur_.eof()) {
            return fail();
        }
        return value;
    }

private:
    [[nodiscard]] bool permissive() const noexcept { return opts_.mode == grammar::permissive; }

    static std::unexpected<std::error_code> fail() {
        return make_unexpected(error_code::malformed_json);
    }

    result<json_value> parse_value(size_t depth) {
        if (depth > opts_.max_depth) {
            return fail();
        }
        cur_.skip_ws();
        switch (cur_.peek()) {
        case '{':
            return parse_object(depth);
        case '[':
            return parse_array(depth);
        case '\"':
            return parse_string_value('\"');
        case '\'':
            if (permissive()) {
                return parse_string_value('\'');
            }
            return fail();
        default:
            return permissive() ? parse_unquoted() : parse_literal();
        }
    }

    result<json_value> parse_object(size_t depth) {
        (void)cur_.try_object_start();
        json_value obj = json_value::object_node();
        if (cur_.try_object_end()) {
            return obj;
        }
        while (true) {
            auto key = parse_key();
            if (!key) {
                return fail();
            }
            if (!cur_.consume(':')) {
                return fail();
            }
            auto value = parse_value(depth + 1);
            if (!value) {
                return value;
            }
            obj.set_member(std::move(*key), std::move(*value));
            if (cur_.try_comma()) {
                if (permissive() && cur_.try_object_end()) {
                    return obj;
                }
                continue;
            }
            if (cur_.try_object_end()) {
                return obj;
            }
            return fail();
        }
    }

    result<json_value> parse_array(size_t depth) {
        (void)cur_.try_array_start();
        json_value arr = json_value::array_node();
        if (cur_.try_array_end()) {
            return arr;
        }
        while (true) {
            auto value = parse_value(depth + 1);
            if (!value) {
                return value;
            }
            arr.push_back(std::move(*value));
            if (cur_.try_comma()) {
                if (permissive() && cur_.try_array_end()) {
                    return arr;
                }
                continue;
            }
            if (cur_.try_array_end()) {
                return arr;
            }
            return fail();
        }
    }

    std::optional<std::string> parse_key() {
        cur_.skip_ws();
        char c = cur_.peek();
        if (c == '\"' || (c == '\'' && permissive())) {
            auto raw = cur_.quoted(c);
            if (!raw) {
                return std::nullopt;
            }
            return unescape(*raw);
        }
        if (!permissive()) {
            return std::nullopt;
        }
        const char* begin = cur_.ptr;
        while (!cur_.eof() && !is_structural(*cur_.ptr)) {
            ++cur_.ptr;
        }
        auto key = serde::trim_view(std::string_view(begin, static_cast<size_t>(cur_.ptr - begin)));
        if (key.empty() || cur_.peek() != ':') {
            return std::nullopt;
        }
        return std::string(key);
    }

    result<json_value> parse_string_value(char quote) {
        auto raw = cur_.quoted(quote);
        if (!raw) {
            return fail();
        }
        auto text = unescape(*raw);
        if (!text) {
            return fail();
        }
        return json_value::string_node(std::move(*text));
    }

    result<json_value> parse_literal() {
        if (cur_.consume_literal("true")) {
            return json_value::bool_node(true);
        }
        if (cur_.consume_literal("false")) {
            return json_value::bool_node(false);
        }
        if (cur_.consume_literal("null")) {
            return json_value::null_node();
        }
        std::string_view rest(cur_.ptr, static_cast<size_t>(cur_.end - cur_.ptr));
        size_t len = serde::scan_number(rest);
        if (len == 0) {
            return fail();
        }
        cur_.ptr += len;
        return json_value::number_node(std::string(rest.substr(0, len)));
    }

    // Permissive scalars run until the next separator; whatever is not a
    // JSON literal or number becomes a string.
    result<json_value> parse_unquoted() {
        const char* begin = cur_.ptr;
        while (!cur_.eof() && *cur_.ptr != ',' && *cur_.ptr != '}' && *cur_.ptr != ']') {
            ++cur_.ptr;
        }
        auto token =
            serde::trim_view(std::string_view(begin, static_cast<size_t>(cur_.ptr - begin)));
        if (token.empty()) {
            return fail();
        }
        if (token == "true") {
            return json_value::bool_node(true);
        }
        if (token == "false") {
            return json_value::bool_node(false);
        }
        if (token == "null") {
            return json_value::null_node();
        }
        if (serde::is_number_literal(token)) {
            return json_value::number_node(std::string(token));
        }
        return json_value::string_node(std::string(token));
    }

    std::optional<std::string> unescape(std::string_view raw) const {
        std::string out;
        out.reserve(raw.size());
        for (size_t i = 0; i < raw.size(); ++i) {
            char c = raw[i];
            if (c != '\\') {
                if (static_cast<unsigned char>(c) < 0x20 && !permissive()) {
                    return std::nullopt;
                }
                out.push_back(c);
                continue;
            }
            if (++i >= raw.size()) {
                return std::nullopt;
            }
            char e = raw[i];
            switch (e) {
            case '\"':
            case '\\':
            case '/':
                out.push_back(e);
                break;
            case 'b':
                out.push_back('\b');
                break;
            case 'f':
                out.push_back('\f');
                break;
            case 'n':
                out.push_back('\n');
                break;
            case 'r':
                out.push_back('\r');
                break;
            case 't':
                out.push_back('\t');
                break;
            case 'u': {
                auto cp = read_hex4(raw, i + 1);
                if (!cp) {
                    return std::nullopt;
                }
                i += 4;
                uint32_t code = *cp;
                if (code >= 0xD800 && code <= 0xDBFF && i + 6 < raw.size() &&
                    raw[i + 1] == '\\' && raw[i + 2] == 'u') {
                    auto low = read_hex4(raw, i + 3);
                    if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                        i += 6;
                    }
                }
                if (code >= 0xD800 && code <= 0xDFFF) {
                    code = 0xFFFD; // unpaired surrogate
                }
                serde::append_utf8(out, code);
                break;
            }
            default:
                if (!permissive()) {
                    return std::nullopt;
                }
                out.push_back(e);
                break;
            }
        }
        return out;
    }

    json_cursor cur_;
    const parse_options& opts_;
};

} // namespace

result<json_value> parse(std::string_view text, const parse_options& opts) {
    parser p(text, opts);
    return p.parse_document();
}

} // namespace tamper::json
