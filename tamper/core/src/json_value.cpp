#include "tamper/core/json_value.hpp"
#include "tamper/core/serde.hpp"

#include <algorithm>

namespace tamper::json {

json_value* json_value::find_member(std::string_view key) noexcept {
    for (auto& kv : object) {
        if (kv.first == key) {
            return kv.second.get();
        }
    }
    return nullptr;
}

const json_value* json_value::find_member(std::string_view key) const noexcept {
    for (const auto& kv : object) {
        if (kv.first == key) {
            return kv.second.get();
        }
    }
    return nullptr;
}

void json_value::set_member(std::string key, json_value value) {
    if (auto* existing = find_member(key)) {
        *existing = std::move(value);
        return;
    }
    object.emplace_back(std::move(key), std::make_unique<json_value>(std::move(value)));
}

bool json_value::erase_member(std::string_view key) {
    auto it = std::find_if(
        object.begin(), object.end(), [&](const member& kv) { return kv.first == key; });
    if (it == object.end()) {
        return false;
    }
    object.erase(it);
    return true;
}

void json_value::push_back(json_value value) {
    array.push_back(std::make_unique<json_value>(std::move(value)));
}

json_value json_value::clone() const {
    json_value copy;
    copy.kind = kind;
    copy.scalar = scalar;
    copy.object.reserve(object.size());
    for (const auto& kv : object) {
        copy.object.emplace_back(kv.first, std::make_unique<json_value>(kv.second->clone()));
    }
    copy.array.reserve(array.size());
    for (const auto& item : array) {
        copy.array.push_back(std::make_unique<json_value>(item->clone()));
    }
    return copy;
}

void serialize_into(const json_value& value, std::string& out, bool sort_keys) {
    switch (value.kind) {
    case value_kind::null:
        out += "null";
        break;
    case value_kind::boolean:
    case value_kind::number:
        out += value.scalar;
        break;
    case value_kind::string:
        out.push_back('\"');
        out += serde::escape_json_string(value.scalar);
        out.push_back('\"');
        break;
    case value_kind::object: {
        std::vector<const json_value::member*> members;
        members.reserve(value.object.size());
        for (const auto& kv : value.object) {
            members.push_back(&kv);
        }
        if (sort_keys) {
            std::stable_sort(members.begin(), members.end(), [](const auto* a, const auto* b) {
                return a->first < b->first;
            });
        }
        out.push_back('{');
        for (size_t i = 0; i < members.size(); ++i) {
            if (i != 0) {
                out.push_back(',');
            }
            out.push_back('\"');
            out += serde::escape_json_string(members[i]->first);
            out += "\":";
            serialize_into(*members[i]->second, out, sort_keys);
        }
        out.push_back('}');
        break;
    }
    case value_kind::array:
        out.push_back('[');
        for (size_t i = 0; i < value.array.size(); ++i) {
            if (i != 0) {
                out.push_back(',');
            }
            serialize_into(*value.array[i], out, sort_keys);
        }
        out.push_back(']');
        break;
    }
}

std::string serialize(const json_value& value, bool sort_keys) {
    std::string out;
    serialize_into(value, out, sort_keys);
    return out;
}

} // namespace tamper::json
