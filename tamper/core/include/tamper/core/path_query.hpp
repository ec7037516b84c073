#pragma once

#include "json_value.hpp"
#include "result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tamper::json {

enum class segment_kind : uint8_t { member, index, wildcard };

struct path_segment {
    segment_kind kind{segment_kind::member};
    std::string name; // member
    int64_t index = 0; // index, negative counts from the end
};

enum class path_function : uint8_t { none, keys, length };

struct compiled_path {
    std::vector<path_segment> segments;
    path_function function = path_function::none;

    [[nodiscard]] bool is_root() const noexcept {
        return segments.empty() && function == path_function::none;
    }

    [[nodiscard]] bool is_definite() const noexcept {
        for (const auto& seg : segments) {
            if (seg.kind == segment_kind::wildcard) {
                return false;
            }
        }
        return true;
    }
};

// Compiles the supported path-query subset:
//   [$] ( .name | .* | ['name'] | ["name"] | [n] | [*] )* [ .keys() | .length() ]
// A path not starting with '$' is read relative to the root. Blank characters
// in dot notation, empty names, trailing dots, deep scan, filters, slices and
// unions are rejected with error_code::malformed_path.
[[nodiscard]] result<compiled_path> compile_path(std::string_view expression);

// Read-only resolution: definite paths yield the node itself, indefinite ones
// an array of matches. Missing definite steps are error_code::path_not_found.
[[nodiscard]] result<json_value> resolve_path(const json_value& root, const compiled_path& path);

// Path-addressed access to a JSON tree. Absence is always reported as
// error_code::path_not_found; implementations never throw for missing nodes.
class path_query {
public:
    virtual ~path_query() = default;

    [[nodiscard]] virtual result<json_value> resolve(const compiled_path& path) const = 0;
    // A write that reaches no node, wildcard paths included, is path_not_found.
    virtual result<void> set(const compiled_path& path, const json_value& value) = 0;
    virtual result<void> erase(const compiled_path& path) = 0;
    virtual result<void> rename(const compiled_path& parent,
                                std::string_view old_key,
                                std::string_view new_key) = 0;
};

class dom_path_query final : public path_query {
public:
    explicit dom_path_query(json_value& root) noexcept : root_(root) {}

    [[nodiscard]] result<json_value> resolve(const compiled_path& path) const override;
    result<void> set(const compiled_path& path, const json_value& value) override;
    result<void> erase(const compiled_path& path) override;
    result<void> rename(const compiled_path& parent,
                        std::string_view old_key,
                        std::string_view new_key) override;

private:
    json_value& root_;
};

} // namespace tamper::json
