#include "tamper/core/path_address.hpp"

#include <algorithm>

namespace tamper::path {

namespace {

bool has_prefix(std::string_view path, std::string_view prefix) noexcept {
    if (path.starts_with(prefix)) {
        return true;
    }
    // Sanitized form: "$[0]." / "$[*]."
    return path.size() >= prefix.size() &&
           path.substr(0, prefix.size() - 1) == prefix.substr(0, prefix.size() - 1) &&
           path[prefix.size() - 1] == '.';
}

} // namespace

std::string sanitize(std::string_view path) {
    std::string out(path);
    std::replace(out.begin(), out.end(), '#', '.');
    return out;
}

bool is_root_array_prefixed(std::string_view path) noexcept {
    return has_prefix(path, first_element_prefix) || has_prefix(path, all_elements_prefix);
}

std::string prefix_first_element(std::string_view path) {
    if (is_root_array_prefixed(path)) {
        return std::string(path);
    }
    std::string out(first_element_prefix);
    out.append(path);
    return out;
}

std::string prefix_all_elements(std::string_view path) {
    if (is_root_array_prefixed(path)) {
        return std::string(path);
    }
    std::string out(all_elements_prefix);
    out.append(path);
    return out;
}

std::string quote_key(std::string_view key) {
    if (key.find(' ') == std::string_view::npos) {
        return std::string(key);
    }
    std::string out = "['";
    out.append(key);
    out += "']";
    return out;
}

} // namespace tamper::path
