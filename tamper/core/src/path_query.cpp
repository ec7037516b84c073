#include "tamper/core/path_query.hpp"
#include "tamper/core/serde.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <span>
#include <utility>

namespace tamper::json {

namespace {

using node_list = std::vector<json_value*>;

std::unexpected<std::error_code> malformed() {
    return make_unexpected(error_code::malformed_path);
}

std::unexpected<std::error_code> not_found() {
    return make_unexpected(error_code::path_not_found);
}

class path_compiler {
public:
    explicit path_compiler(std::string_view expr) : expr_(expr) {}

    result<compiled_path> compile() {
        if (expr_.empty()) {
            return malformed();
        }
        if (expr_.front() == '$') {
            pos_ = 1;
        } else if (expr_.front() == '@') {
            return malformed();
        } else if (expr_.front() != '[') {
            // Relative form: "a.b" reads as "$.a.b".
            if (!read_name()) {
                return malformed();
            }
        }
        while (pos_ < expr_.size()) {
            if (out_.function != path_function::none) {
                return malformed();
            }
            char c = expr_[pos_];
            if (c == '.') {
                ++pos_;
                if (pos_ >= expr_.size() || expr_[pos_] == '.') {
                    return malformed(); // trailing dot or deep scan
                }
                if (expr_[pos_] == '[') {
                    if (!read_bracket()) {
                        return malformed();
                    }
                } else if (expr_[pos_] == '*') {
                    ++pos_;
                    out_.segments.push_back(path_segment{segment_kind::wildcard, {}, 0});
                } else if (!read_name()) {
                    return malformed();
                }
            } else if (c == '[') {
                if (!read_bracket()) {
                    return malformed();
                }
            } else {
                return malformed();
            }
        }
        return std::move(out_);
    }

private:
    bool read_name() {
        size_t begin = pos_;
        while (pos_ < expr_.size() && expr_[pos_] != '.' && expr_[pos_] != '[') {
            if (std::isspace(static_cast<unsigned char>(expr_[pos_]))) {
                return false; // blanks need bracket notation
            }
            ++pos_;
        }
        auto name = expr_.substr(begin, pos_ - begin);
        if (name.empty()) {
            return false;
        }
        if (name.ends_with("()")) {
            if (pos_ != expr_.size()) {
                return false;
            }
            if (name == "keys()") {
                out_.function = path_function::keys;
                return true;
            }
            if (name == "length()") {
                out_.function = path_function::length;
                return true;
            }
            return false;
        }
        out_.segments.push_back(path_segment{segment_kind::member, std::string(name), 0});
        return true;
    }

    void skip_blanks() noexcept {
        while (pos_ < expr_.size() && expr_[pos_] == ' ') {
            ++pos_;
        }
    }

    bool expect_close() {
        skip_blanks();
        if (pos_ >= expr_.size() || expr_[pos_] != ']') {
            return false;
        }
        ++pos_;
        return true;
    }

    bool read_bracket() {
        ++pos_; // '['
        skip_blanks();
        if (pos_ >= expr_.size()) {
            return false;
        }
        char c = expr_[pos_];
        if (c == '*') {
            ++pos_;
            out_.segments.push_back(path_segment{segment_kind::wildcard, {}, 0});
            return expect_close();
        }
        if (c == '\'' || c == '\"') {
            size_t close = expr_.find(c, pos_ + 1);
            if (close == std::string_view::npos) {
                return false;
            }
            auto name = expr_.substr(pos_ + 1, close - pos_ - 1);
            pos_ = close + 1;
            out_.segments.push_back(path_segment{segment_kind::member, std::string(name), 0});
            return expect_close();
        }
        size_t begin = pos_;
        if (c == '-') {
            ++pos_;
        }
        while (pos_ < expr_.size() && std::isdigit(static_cast<unsigned char>(expr_[pos_]))) {
            ++pos_;
        }
        int64_t index = 0;
        auto digits = expr_.substr(begin, pos_ - begin);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
        if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
            return false;
        }
        out_.segments.push_back(path_segment{segment_kind::index, {}, index});
        return expect_close();
    }

    std::string_view expr_;
    size_t pos_ = 0;
    compiled_path out_;
};

template <typename Node> using nodes_of = std::vector<Node*>;

template <typename Node> Node* element_at(Node& node, int64_t index) noexcept {
    if (!node.is_array()) {
        return nullptr;
    }
    auto size = static_cast<int64_t>(node.array.size());
    int64_t at = index < 0 ? size + index : index;
    if (at < 0 || at >= size) {
        return nullptr;
    }
    return node.array[static_cast<size_t>(at)].get();
}

template <typename Node> Node* child_of(Node& node, const path_segment& seg) noexcept {
    switch (seg.kind) {
    case segment_kind::member:
        return node.is_object() ? node.find_member(seg.name) : nullptr;
    case segment_kind::index:
        return element_at(node, seg.index);
    case segment_kind::wildcard:
        break;
    }
    return nullptr;
}

template <typename Node> void append_children(Node& node, nodes_of<Node>& out) {
    if (node.is_object()) {
        for (auto& kv : node.object) {
            out.push_back(kv.second.get());
        }
    } else if (node.is_array()) {
        for (auto& item : node.array) {
            out.push_back(item.get());
        }
    }
}

// Definite walks fail on the first missing step; indefinite walks drop it.
template <typename Node>
result<nodes_of<Node>> select(Node& root, std::span<const path_segment> segs, bool definite) {
    nodes_of<Node> current{&root};
    for (const auto& seg : segs) {
        nodes_of<Node> next;
        for (Node* node : current) {
            if (seg.kind == segment_kind::wildcard) {
                append_children(*node, next);
                continue;
            }
            if (auto* child = child_of(*node, seg)) {
                next.push_back(child);
            } else if (definite) {
                return not_found();
            }
        }
        current = std::move(next);
    }
    return current;
}

result<node_list> parents_of(json_value& root, const compiled_path& path) {
    std::span<const path_segment> segs(path.segments);
    return select(root, segs.first(segs.size() - 1), path.is_definite());
}

result<json_value> apply_function(json_value value, path_function fn) {
    switch (fn) {
    case path_function::none:
        return value;
    case path_function::keys: {
        if (!value.is_object()) {
            return not_found();
        }
        json_value names = json_value::array_node();
        for (const auto& kv : value.object) {
            names.push_back(json_value::string_node(kv.first));
        }
        return names;
    }
    case path_function::length:
        if (value.is_array()) {
            return json_value::number_node(std::to_string(value.array.size()));
        }
        if (value.is_object()) {
            return json_value::number_node(std::to_string(value.object.size()));
        }
        return not_found();
    }
    return not_found();
}

} // namespace

result<compiled_path> compile_path(std::string_view expression) {
    path_compiler compiler(serde::trim_view(expression));
    return compiler.compile();
}

result<json_value> resolve_path(const json_value& root, const compiled_path& path) {
    const bool definite = path.is_definite();
    auto nodes = select(root, path.segments, definite);
    if (!nodes) {
        return std::unexpected(nodes.error());
    }
    json_value out;
    if (definite) {
        out = nodes->front()->clone();
    } else {
        out = json_value::array_node();
        for (const json_value* node : *nodes) {
            out.push_back(node->clone());
        }
    }
    return apply_function(std::move(out), path.function);
}

result<json_value> dom_path_query::resolve(const compiled_path& path) const {
    return resolve_path(root_, path);
}

result<void> dom_path_query::set(const compiled_path& path, const json_value& value) {
    if (path.function != path_function::none) {
        return malformed();
    }
    if (path.segments.empty()) {
        root_ = value.clone();
        return {};
    }
    auto parents = parents_of(root_, path);
    if (!parents) {
        return std::unexpected(parents.error());
    }
    const auto& leaf = path.segments.back();
    const bool definite = path.is_definite();
    size_t written = 0;
    for (json_value* parent : *parents) {
        if (leaf.kind == segment_kind::wildcard) {
            node_list children;
            append_children(*parent, children);
            for (json_value* child : children) {
                *child = value.clone();
                ++written;
            }
            continue;
        }
        if (auto* child = child_of(*parent, leaf)) {
            *child = value.clone();
            ++written;
        } else if (definite) {
            return not_found();
        }
    }
    if (written == 0) {
        return not_found();
    }
    return {};
}

result<void> dom_path_query::erase(const compiled_path& path) {
    if (path.function != path_function::none || path.segments.empty()) {
        return malformed();
    }
    auto parents = parents_of(root_, path);
    if (!parents) {
        return std::unexpected(parents.error());
    }
    const auto& leaf = path.segments.back();
    const bool definite = path.is_definite();
    size_t removed = 0;
    for (json_value* parent : *parents) {
        switch (leaf.kind) {
        case segment_kind::member:
            if (parent->is_object() && parent->erase_member(leaf.name)) {
                ++removed;
            } else if (definite) {
                return not_found();
            }
            break;
        case segment_kind::index:
            if (auto* child = element_at(*parent, leaf.index)) {
                auto it = std::find_if(parent->array.begin(),
                                       parent->array.end(),
                                       [child](const auto& item) { return item.get() == child; });
                parent->array.erase(it);
                ++removed;
            } else if (definite) {
                return not_found();
            }
            break;
        case segment_kind::wildcard:
            removed += parent->object.size() + parent->array.size();
            parent->object.clear();
            parent->array.clear();
            break;
        }
    }
    if (removed == 0) {
        return not_found();
    }
    return {};
}

// The renamed member moves to the end of its object, like a remove + put.
result<void> dom_path_query::rename(const compiled_path& parent,
                                    std::string_view old_key,
                                    std::string_view new_key) {
    if (parent.function != path_function::none) {
        return malformed();
    }
    const bool definite = parent.is_definite();
    auto nodes = select(root_, parent.segments, definite);
    if (!nodes) {
        return std::unexpected(nodes.error());
    }
    size_t renamed = 0;
    for (json_value* node : *nodes) {
        auto* current = node->is_object() ? node->find_member(old_key) : nullptr;
        if (!current) {
            if (definite) {
                return not_found();
            }
            continue;
        }
        json_value moved = std::move(*current);
        node->erase_member(old_key);
        node->set_member(std::string(new_key), std::move(moved));
        ++renamed;
    }
    if (renamed == 0) {
        return not_found();
    }
    return {};
}

} // namespace tamper::json
