#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tamper::json {

enum class value_kind : uint8_t { null, boolean, number, string, object, array };

// Mutable JSON tree. Object members keep insertion order and numbers keep
// their source lexeme, so parse + serialize never rewrites numeric text.
struct json_value {
    using member = std::pair<std::string, std::unique_ptr<json_value>>;

    value_kind kind{value_kind::null};
    std::string scalar; // unescaped string, number lexeme or "true"/"false"
    std::vector<member> object;
    std::vector<std::unique_ptr<json_value>> array;

    static json_value null_node() { return json_value{}; }

    static json_value bool_node(bool value) {
        json_value n;
        n.kind = value_kind::boolean;
        n.scalar = value ? "true" : "false";
        return n;
    }

    static json_value number_node(std::string lexeme) {
        json_value n;
        n.kind = value_kind::number;
        n.scalar = std::move(lexeme);
        return n;
    }

    static json_value string_node(std::string value) {
        json_value n;
        n.kind = value_kind::string;
        n.scalar = std::move(value);
        return n;
    }

    static json_value object_node() {
        json_value n;
        n.kind = value_kind::object;
        return n;
    }

    static json_value array_node() {
        json_value n;
        n.kind = value_kind::array;
        return n;
    }

    [[nodiscard]] bool is_object() const noexcept { return kind == value_kind::object; }
    [[nodiscard]] bool is_array() const noexcept { return kind == value_kind::array; }
    [[nodiscard]] bool is_string() const noexcept { return kind == value_kind::string; }
    [[nodiscard]] bool is_scalar() const noexcept { return !is_object() && !is_array(); }

    json_value* find_member(std::string_view key) noexcept;
    const json_value* find_member(std::string_view key) const noexcept;

    // Replaces an existing member in place, appends otherwise.
    void set_member(std::string key, json_value value);
    bool erase_member(std::string_view key);
    void push_back(json_value value);

    [[nodiscard]] json_value clone() const;
};

void serialize_into(const json_value& value, std::string& out, bool sort_keys = false);
[[nodiscard]] std::string serialize(const json_value& value, bool sort_keys = false);

} // namespace tamper::json
