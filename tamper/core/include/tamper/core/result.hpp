#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace tamper {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    path_not_found = 1,
    malformed_path = 2,
    malformed_json = 3,
    not_an_object = 4,
    invalid_match_config = 5,
    invalid_regex = 6,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "tamper"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::path_not_found:
            return "path not found";
        case ec::malformed_path:
            return "malformed path expression";
        case ec::malformed_json:
            return "malformed JSON input";
        case ec::not_an_object:
            return "document root is not an object";
        case ec::invalid_match_config:
            return "invalid match configuration";
        case ec::invalid_regex:
            return "invalid regular expression";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

inline std::unexpected<std::error_code> make_unexpected(error_code e) {
    return std::unexpected(make_error_code(e));
}

} // namespace tamper

namespace std {
template <> struct is_error_code_enum<tamper::error_code> : true_type {};
} // namespace std
