#pragma once

#include "engine_config.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace tamper {

// A fuzzer that rewrites one field of an existing payload at a time.
class field_strategy {
public:
    virtual ~field_strategy() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::string description() const = 0;
    // Reported when applies_to() rejects a field.
    [[nodiscard]] virtual std::string_view skip_message() const noexcept = 0;

    [[nodiscard]] virtual bool applies_to(std::string_view payload,
                                          std::string_view field) const = 0;
    // Pre-serialized JSON fragments to put in place of the field.
    [[nodiscard]] virtual std::vector<std::string> fuzz_values(std::string_view field) const = 0;

    // One mutated payload per fuzz value; empty when the field is skipped.
    [[nodiscard]] virtual std::vector<std::string> mutate(std::string_view payload,
                                                          std::string_view field) const = 0;
};

// A fuzzer that replaces the whole request body.
class body_strategy {
public:
    virtual ~body_strategy() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::string description() const = 0;
    [[nodiscard]] virtual std::string_view scenario() const noexcept = 0;

    [[nodiscard]] virtual std::string payload() = 0;
};

class replace_arrays_with_primitives final : public field_strategy {
public:
    static constexpr std::string_view primitive_value = "cats_primitive_string";

    explicit replace_arrays_with_primitives(const engine_config& cfg = default_engine_config())
        : cfg_(&cfg) {}

    [[nodiscard]] std::string_view name() const noexcept override {
        return "ReplaceArraysWithPrimitives";
    }
    [[nodiscard]] std::string description() const override;
    [[nodiscard]] std::string_view skip_message() const noexcept override {
        return "Fuzzer only runs for arrays";
    }

    [[nodiscard]] bool applies_to(std::string_view payload, std::string_view field) const override;
    [[nodiscard]] std::vector<std::string> fuzz_values(std::string_view field) const override;
    [[nodiscard]] std::vector<std::string> mutate(std::string_view payload,
                                                  std::string_view field) const override;

private:
    const engine_config* cfg_;
};

class random_string_body final : public body_strategy {
public:
    static constexpr size_t default_length = 10000;

    // Throws std::invalid_argument for a zero length.
    explicit random_string_body(size_t length = default_length,
                                uint32_t seed = std::random_device{}());

    [[nodiscard]] std::string_view name() const noexcept override { return "RandomStringBody"; }
    [[nodiscard]] std::string description() const override {
        return "send a request with a random string body";
    }
    [[nodiscard]] std::string_view scenario() const noexcept override {
        return "Send a request with an random string body";
    }

    [[nodiscard]] size_t length() const noexcept { return length_; }
    [[nodiscard]] std::string payload() override;

private:
    size_t length_;
    std::mt19937 engine_;
};

} // namespace tamper
