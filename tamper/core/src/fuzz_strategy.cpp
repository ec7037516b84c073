#include "tamper/core/fuzz_strategy.hpp"
#include "tamper/core/json_document.hpp"
#include "tamper/core/serde.hpp"

#include <stdexcept>

namespace tamper {

namespace {

constexpr std::string_view fuzz_component = "fuzz";

constexpr std::string_view alphanumeric =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

} // namespace

std::string replace_arrays_with_primitives::description() const {
    return "iterate through each array field and replace it with primitive values";
}

bool replace_arrays_with_primitives::applies_to(std::string_view payload,
                                                std::string_view field) const {
    return payload::is_array(payload, field, *cfg_).value_or(false);
}

std::vector<std::string> replace_arrays_with_primitives::fuzz_values(std::string_view) const {
    return {"\"" + serde::escape_json_string(primitive_value) + "\""};
}

std::vector<std::string> replace_arrays_with_primitives::mutate(std::string_view payload,
                                                                std::string_view field) const {
    if (!applies_to(payload, field)) {
        cfg_->emit(fuzz_component,
                   std::string(name()) + " skips " + std::string(field) + ": " +
                       std::string(skip_message()));
        return {};
    }
    std::vector<std::string> out;
    for (const auto& value : fuzz_values(field)) {
        out.push_back(payload::replace_field(payload, field, value, *cfg_));
    }
    return out;
}

random_string_body::random_string_body(size_t length, uint32_t seed)
    : length_(length), engine_(seed) {
    if (length_ == 0) {
        throw std::invalid_argument("random_string_body: length must be positive");
    }
}

std::string random_string_body::payload() {
    std::uniform_int_distribution<size_t> pick(0, alphanumeric.size() - 1);
    std::string out;
    out.reserve(length_);
    for (size_t i = 0; i < length_; ++i) {
        out.push_back(alphanumeric[pick(engine_)]);
    }
    return out;
}

} // namespace tamper
