#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tamper::serde {

inline std::string_view trim_view(std::string_view sv) noexcept {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
        sv.remove_suffix(1);
    }
    return sv;
}

inline bool is_blank(std::string_view sv) noexcept {
    return trim_view(sv).empty();
}

inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

struct json_cursor {
    const char* ptr;
    const char* end;

    explicit json_cursor(std::string_view text)
        : ptr(text.data()), end(text.data() + text.size()) {}

    bool eof() const noexcept { return ptr >= end; }

    char peek() const noexcept { return eof() ? '\0' : *ptr; }

    void skip_ws() noexcept {
        while (!eof() && std::isspace(static_cast<unsigned char>(*ptr))) {
            ++ptr;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }

    bool consume_literal(std::string_view lit) noexcept {
        if (static_cast<size_t>(end - ptr) < lit.size()) {
            return false;
        }
        if (std::string_view(ptr, lit.size()) != lit) {
            return false;
        }
        ptr += lit.size();
        return true;
    }

    // Raw contents between a pair of `quote` characters, escapes left in place.
    std::optional<std::string_view> quoted(char quote = '\"') noexcept {
        skip_ws();
        if (eof() || *ptr != quote) {
            return std::nullopt;
        }
        ++ptr;
        const char* str_start = ptr;
        while (!eof() && *ptr != quote) {
            if (*ptr == '\\' && (ptr + 1) < end) {
                ptr += 2;
                continue;
            }
            ++ptr;
        }
        if (eof()) {
            return std::nullopt;
        }
        const char* stop = ptr;
        ++ptr; // consume closing quote
        return std::string_view(str_start, static_cast<size_t>(stop - str_start));
    }

    bool try_object_start() noexcept { return consume('{'); }
    bool try_object_end() noexcept { return consume('}'); }
    bool try_array_start() noexcept { return consume('['); }
    bool try_array_end() noexcept { return consume(']'); }
    bool try_comma() noexcept { return consume(','); }
};

// Length of the RFC 8259 number at the front of `sv`, 0 when there is none.
inline size_t scan_number(std::string_view sv) noexcept {
    size_t i = 0;
    auto digit = [&](size_t at) {
        return at < sv.size() && std::isdigit(static_cast<unsigned char>(sv[at]));
    };
    if (i < sv.size() && sv[i] == '-') {
        ++i;
    }
    if (!digit(i)) {
        return 0;
    }
    if (sv[i] == '0') {
        ++i;
    } else {
        while (digit(i)) {
            ++i;
        }
    }
    if (i < sv.size() && sv[i] == '.') {
        if (!digit(i + 1)) {
            return 0;
        }
        ++i;
        while (digit(i)) {
            ++i;
        }
    }
    if (i < sv.size() && (sv[i] == 'e' || sv[i] == 'E')) {
        size_t j = i + 1;
        if (j < sv.size() && (sv[j] == '+' || sv[j] == '-')) {
            ++j;
        }
        if (!digit(j)) {
            return 0;
        }
        while (digit(j)) {
            ++j;
        }
        i = j;
    }
    return i;
}

inline bool is_number_literal(std::string_view sv) noexcept {
    return !sv.empty() && scan_number(sv) == sv.size();
}

inline void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::string escape_json_string(std::string_view sv) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '\"':
            out += "\\\"";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                out += "\\u00";
                out.push_back(hex[(c >> 4) & 0x0F]);
                out.push_back(hex[c & 0x0F]);
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

} // namespace tamper::serde
