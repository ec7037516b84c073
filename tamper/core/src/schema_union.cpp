#include "tamper/core/schema_union.hpp"
#include "tamper/core/json_document.hpp"
#include "tamper/core/path_address.hpp"

namespace tamper {

namespace {

constexpr std::string_view union_component = "union";

// Renames the surviving variant, then drops its siblings one by one. Each
// step that fails is traced and skipped; it never aborts the others.
std::string collapse_union(json_document& doc,
                           std::string_view payload,
                           const union_request& request,
                           const engine_config& cfg) {
    auto last_dot = request.target_path.rfind('.');
    if (last_dot == std::string::npos) {
        cfg.emit(union_component, "cannot split target path " + request.target_path);
        return std::string(payload);
    }
    std::string parent = request.target_path.substr(0, last_dot);
    std::string slot = request.target_path.substr(last_dot + 1);

    auto renamed = doc.rename(parent, request.alternative_key, slot);
    if (!renamed) {
        cfg.emit(union_component,
                 "could not rename " + request.alternative_key + " under " + parent + ": " +
                     renamed.error().message());
    }

    for (const auto& key : request.eliminate_keys) {
        std::string node = parent + "." + path::quote_key(key);
        cfg.emit(union_component, "to delete " + node);
        auto erased = doc.erase(node);
        if (!erased) {
            cfg.emit(union_component,
                     "path not found when removing any_of/one_of: " + node + " (" +
                         erased.error().message() + ")");
        }
    }
    return doc.to_string();
}

} // namespace

std::string resolve_union(std::string_view payload,
                          const union_request& request,
                          const engine_config& cfg) {
    if (request.target_path == "$") {
        return request.new_value;
    }

    auto value = json::parse(request.new_value, cfg.permissive);
    if (!value) {
        cfg.emit(union_component, "could not add node " + request.target_path);
        return std::string(payload);
    }

    auto doc = json_document::parse(payload, cfg.permissive);
    if (!doc) {
        cfg.emit(union_component, "payload is not JSON, leaving it unchanged");
        return std::string(payload);
    }

    auto applied = doc->set(request.target_path, *value);
    if (applied) {
        return doc->to_string();
    }
    if (applied.error() != error_code::path_not_found) {
        cfg.emit(union_component,
                 "could not add node " + request.target_path + ": " + applied.error().message());
        return std::string(payload);
    }
    if (payload.find(union_marker) == std::string_view::npos) {
        return std::string(payload);
    }
    return collapse_union(*doc, payload, request, cfg);
}

} // namespace tamper
