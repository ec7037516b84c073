#pragma once

#include "engine_config.hpp"
#include "json_parser.hpp"
#include "json_value.hpp"
#include "path_query.hpp"
#include "result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tamper {

// A parsed payload with path-query access. Paths given here are path-query
// expressions; '#' field paths go through path::sanitize first.
class json_document {
public:
    explicit json_document(json::json_value root) noexcept : root_(std::move(root)) {}

    json_document(json_document&&) noexcept = default;
    json_document& operator=(json_document&&) noexcept = default;
    json_document(const json_document&) = delete;
    json_document& operator=(const json_document&) = delete;

    [[nodiscard]] static result<json_document> parse(std::string_view text,
                                                     const json::parse_options& opts = {});

    [[nodiscard]] bool is_root_array() const noexcept { return root_.is_array(); }
    [[nodiscard]] const json::json_value& root() const noexcept { return root_; }

    [[nodiscard]] result<json::json_value> resolve(std::string_view path) const;
    result<void> set(std::string_view path, const json::json_value& value);
    result<void> erase(std::string_view path);
    result<void> rename(std::string_view parent_path,
                        std::string_view old_key,
                        std::string_view new_key);
    result<void> insert_root(std::string key, json::json_value value);

    // Compact text, members in document order.
    [[nodiscard]] std::string to_string() const { return json::serialize(root_); }
    // Compact text with object members sorted by key.
    [[nodiscard]] std::string canonical() const { return json::serialize(root_, true); }

private:
    json::json_value root_;
};

} // namespace tamper

namespace tamper::payload {

// Returned by reads that cannot resolve their path.
inline constexpr std::string_view not_set = "NOT_SET";

[[nodiscard]] bool is_not_set(std::string_view value) noexcept;

[[nodiscard]] bool is_valid_json(std::string_view text,
                                 const engine_config& cfg = default_engine_config());
[[nodiscard]] bool is_root_array(std::string_view payload,
                                 const engine_config& cfg = default_engine_config());

// Node-kind tests. Root-array payloads are addressed through their first
// element. Missing paths fold to false in all three; a malformed path folds
// to false for is_object/is_array but is reported by is_primitive; a
// malformed payload is reported by all three.
[[nodiscard]] result<bool> is_primitive(std::string_view payload,
                                        std::string_view field,
                                        const engine_config& cfg = default_engine_config());
[[nodiscard]] result<bool> is_object(std::string_view payload,
                                     std::string_view field,
                                     const engine_config& cfg = default_engine_config());
[[nodiscard]] result<bool> is_array(std::string_view payload,
                                    std::string_view field,
                                    const engine_config& cfg = default_engine_config());

// Strings come back unquoted, anything else as compact JSON; NOT_SET when
// the path cannot be resolved for any reason.
[[nodiscard]] std::string read_field(std::string_view payload,
                                     std::string_view field,
                                     const engine_config& cfg = default_engine_config());
[[nodiscard]] bool is_field_present(std::string_view payload,
                                    std::string_view field,
                                    const engine_config& cfg = default_engine_config());
[[nodiscard]] bool is_valid_non_empty_map(std::string_view payload,
                                          std::string_view field,
                                          const engine_config& cfg = default_engine_config());

// Original text when the payload is blank or the node cannot be removed.
[[nodiscard]] std::string erase_field(std::string_view payload,
                                      std::string_view field,
                                      const engine_config& cfg = default_engine_config());

// Sets the permissively parsed `value` at a path-query; errors are returned.
[[nodiscard]] result<std::string> set_field(std::string_view payload,
                                            std::string_view path,
                                            std::string_view value,
                                            const engine_config& cfg = default_engine_config());

// Field-path flavour of set_field for fuzzers: root arrays are addressed
// element-wise and any failure returns the original payload.
[[nodiscard]] std::string replace_field(std::string_view payload,
                                        std::string_view field,
                                        std::string_view value,
                                        const engine_config& cfg = default_engine_config());

// Adds (or overwrites) a string member at the root object.
[[nodiscard]] std::string insert_root_field(std::string_view payload,
                                            std::string_view key,
                                            std::string_view value,
                                            const engine_config& cfg = default_engine_config());

// True for an absent, blank, `{}` or `"{}"` payload.
[[nodiscard]] bool is_empty_payload(std::optional<std::string_view> payload) noexcept;

[[nodiscard]] bool equal_as_json(std::string_view a,
                                 std::string_view b,
                                 const engine_config& cfg = default_engine_config());

} // namespace tamper::payload
