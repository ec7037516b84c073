#include "tamper/core/response.hpp"

#include <cctype>
#include <utility>

namespace tamper {

int64_t count_lines(std::string_view body) noexcept {
    if (body.empty()) {
        return 0;
    }
    int64_t lines = 0;
    for (char c : body) {
        if (c == '\n') {
            ++lines;
        }
    }
    if (body.back() != '\n') {
        ++lines;
    }
    return lines;
}

int64_t count_words(std::string_view body) noexcept {
    int64_t words = 0;
    bool in_word = false;
    for (char c : body) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    return words;
}

response_descriptor response_descriptor::from_body(int32_t status, std::string body) {
    response_descriptor r;
    r.status = status;
    r.lines = count_lines(body);
    r.words = count_words(body);
    r.bytes = static_cast<int64_t>(body.size());
    r.body = std::move(body);
    return r;
}

} // namespace tamper
