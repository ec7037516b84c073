#include "tamper/core/json_document.hpp"
#include "tamper/core/path_address.hpp"
#include "tamper/core/serde.hpp"

#include <cstdint>

namespace tamper {

result<json_document> json_document::parse(std::string_view text, const json::parse_options& opts) {
    auto root = json::parse(text, opts);
    if (!root) {
        return std::unexpected(root.error());
    }
    return json_document(std::move(*root));
}

result<json::json_value> json_document::resolve(std::string_view path) const {
    auto compiled = json::compile_path(path);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }
    return json::resolve_path(root_, *compiled);
}

result<void> json_document::set(std::string_view path, const json::json_value& value) {
    auto compiled = json::compile_path(path);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }
    json::dom_path_query query(root_);
    return query.set(*compiled, value);
}

result<void> json_document::erase(std::string_view path) {
    auto compiled = json::compile_path(path);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }
    json::dom_path_query query(root_);
    return query.erase(*compiled);
}

result<void> json_document::rename(std::string_view parent_path,
                                   std::string_view old_key,
                                   std::string_view new_key) {
    auto compiled = json::compile_path(parent_path);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }
    json::dom_path_query query(root_);
    return query.rename(*compiled, old_key, new_key);
}

result<void> json_document::insert_root(std::string key, json::json_value value) {
    if (!root_.is_object()) {
        return make_unexpected(error_code::not_an_object);
    }
    root_.set_member(std::move(key), std::move(value));
    return {};
}

} // namespace tamper

namespace tamper::payload {

namespace {

constexpr std::string_view json_component = "json";

enum class node_test : uint8_t { primitive, array };

// Type tests read through the strict grammar; a root array is addressed
// through its first element.
result<bool> test_node(std::string_view payload,
                       std::string_view field,
                       node_test test,
                       const engine_config& cfg) {
    auto doc = json_document::parse(payload, cfg.strict);
    if (!doc) {
        return std::unexpected(doc.error());
    }
    std::string property =
        doc->is_root_array() ? path::prefix_first_element(field) : std::string(field);
    auto node = doc->resolve(path::sanitize(property));
    if (!node) {
        return std::unexpected(node.error());
    }
    return test == node_test::primitive ? node->is_scalar() : node->is_array();
}

bool is_path_failure(const std::error_code& ec) noexcept {
    return ec == error_code::path_not_found || ec == error_code::malformed_path;
}

} // namespace

bool is_not_set(std::string_view value) noexcept {
    return serde::iequals(value, not_set);
}

bool is_valid_json(std::string_view text, const engine_config& cfg) {
    if (!json::parse(text, cfg.strict)) {
        return false;
    }
    return text.find('{') != std::string_view::npos || text.find(']') != std::string_view::npos;
}

bool is_root_array(std::string_view payload, const engine_config& cfg) {
    auto doc = json_document::parse(payload, cfg.permissive);
    return doc && doc->is_root_array();
}

result<bool> is_primitive(std::string_view payload,
                          std::string_view field,
                          const engine_config& cfg) {
    auto tested = test_node(payload, field, node_test::primitive, cfg);
    if (!tested && tested.error() == error_code::path_not_found) {
        return false;
    }
    return tested;
}

result<bool> is_object(std::string_view payload, std::string_view field, const engine_config& cfg) {
    auto tested = test_node(payload, field, node_test::primitive, cfg);
    if (!tested) {
        if (is_path_failure(tested.error())) {
            return false;
        }
        return std::unexpected(tested.error());
    }
    return !*tested;
}

result<bool> is_array(std::string_view payload, std::string_view field, const engine_config& cfg) {
    auto tested = test_node(payload, field, node_test::array, cfg);
    if (!tested && is_path_failure(tested.error())) {
        return false;
    }
    return tested;
}

std::string read_field(std::string_view payload, std::string_view field, const engine_config& cfg) {
    auto doc = json_document::parse(payload, cfg.permissive);
    if (!doc) {
        cfg.emit(json_component, "payload is not JSON, " + std::string(field) + " is NOT_SET");
        return std::string(not_set);
    }
    auto node = doc->resolve(path::sanitize(field));
    if (!node) {
        cfg.emit(json_component,
                 "expected variable " + std::string(field) + " was not found, setting to NOT_SET");
        return std::string(not_set);
    }
    if (node->is_string()) {
        return node->scalar;
    }
    return json::serialize(*node);
}

bool is_field_present(std::string_view payload, std::string_view field, const engine_config& cfg) {
    return !is_not_set(read_field(payload, field, cfg));
}

bool is_valid_non_empty_map(std::string_view payload,
                            std::string_view field,
                            const engine_config& cfg) {
    auto keys = read_field(payload, std::string(field) + ".keys()", cfg);
    return !is_not_set(keys) && keys != "[]";
}

std::string erase_field(std::string_view payload,
                        std::string_view field,
                        const engine_config& cfg) {
    if (serde::is_blank(payload)) {
        return std::string(payload);
    }
    auto doc = json_document::parse(payload, cfg.permissive);
    if (!doc) {
        return std::string(payload);
    }
    auto erased = doc->erase(path::sanitize(field));
    if (!erased) {
        cfg.emit(json_component,
                 "cannot delete " + std::string(field) + ": " + erased.error().message());
        return std::string(payload);
    }
    return doc->to_string();
}

result<std::string> set_field(std::string_view payload,
                              std::string_view path,
                              std::string_view value,
                              const engine_config& cfg) {
    auto doc = json_document::parse(payload, cfg.permissive);
    if (!doc) {
        return std::unexpected(doc.error());
    }
    auto node = json::parse(value, cfg.permissive);
    if (!node) {
        return std::unexpected(node.error());
    }
    auto applied = doc->set(path, *node);
    if (!applied) {
        return std::unexpected(applied.error());
    }
    return doc->to_string();
}

std::string replace_field(std::string_view payload,
                          std::string_view field,
                          std::string_view value,
                          const engine_config& cfg) {
    auto root_array = is_root_array(payload, cfg);
    std::string property = root_array ? path::prefix_all_elements(field) : std::string(field);
    auto replaced = set_field(payload, path::sanitize(property), value, cfg);
    if (!replaced) {
        cfg.emit(json_component,
                 "could not replace " + std::string(field) + ": " + replaced.error().message());
        return std::string(payload);
    }
    return std::move(*replaced);
}

std::string insert_root_field(std::string_view payload,
                              std::string_view key,
                              std::string_view value,
                              const engine_config& cfg) {
    auto doc = json_document::parse(payload, cfg.permissive);
    if (!doc) {
        return std::string(payload);
    }
    auto inserted =
        doc->insert_root(std::string(key), json::json_value::string_node(std::string(value)));
    if (!inserted) {
        cfg.emit(json_component,
                 "cannot add " + std::string(key) + ": " + inserted.error().message());
        return std::string(payload);
    }
    return doc->to_string();
}

bool is_empty_payload(std::optional<std::string_view> payload) noexcept {
    if (!payload) {
        return true;
    }
    auto trimmed = serde::trim_view(*payload);
    return trimmed.empty() || trimmed == "{}" || trimmed == "\"{}\"";
}

bool equal_as_json(std::string_view a, std::string_view b, const engine_config& cfg) {
    if (serde::is_blank(a) || serde::is_blank(b)) {
        return false;
    }
    auto first = json_document::parse(a, cfg.permissive);
    auto second = json_document::parse(b, cfg.permissive);
    if (!first || !second) {
        return false;
    }
    return first->canonical() == second->canonical();
}

} // namespace tamper::payload
