#include "tamper/core/json_document.hpp"
#include "tamper/core/match_config.hpp"
#include "tamper/core/response.hpp"
#include "tamper/core/schema_union.hpp"
#include "tamper/core/serde.hpp"
#include "tamper_cli/options.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

using tamper::result;
using namespace tamper_cli;

namespace {

result<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }
    in.seekg(0, std::ios::end);
    auto size = in.tellg();
    if (size < 0) {
        return std::unexpected(std::make_error_code(std::errc::io_error));
    }
    std::string content;
    content.resize(static_cast<size_t>(size));
    in.seekg(0, std::ios::beg);
    in.read(content.data(), static_cast<std::streamsize>(content.size()));
    return content;
}

tamper::engine_config make_config(const options& opts) {
    tamper::engine_config cfg;
    if (opts.verbose) {
        cfg.trace = tamper::stderr_trace_handler();
    }
    return cfg;
}

result<std::string> load_payload(const options& opts) {
    if (opts.payload_file.empty()) {
        std::cerr << "[" << opts.subcommand << "] payload file is required\n";
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    auto payload = read_file(opts.payload_file);
    if (!payload) {
        std::cerr << "[" << opts.subcommand << "] cannot read " << opts.payload_file << ": "
                  << payload.error().message() << "\n";
    }
    return payload;
}

int run_read(const options& opts, const tamper::engine_config& cfg) {
    auto payload = load_payload(opts);
    if (!payload) {
        return 1;
    }
    std::cout << tamper::payload::read_field(*payload, opts.path, cfg) << "\n";
    return 0;
}

int run_erase(const options& opts, const tamper::engine_config& cfg) {
    auto payload = load_payload(opts);
    if (!payload) {
        return 1;
    }
    std::cout << tamper::payload::erase_field(*payload, opts.path, cfg) << "\n";
    return 0;
}

int run_union(const options& opts, const tamper::engine_config& cfg) {
    auto payload = load_payload(opts);
    if (!payload) {
        return 1;
    }
    if (opts.path.empty()) {
        std::cerr << "[union] --path is required\n";
        return 1;
    }
    tamper::union_request request;
    request.target_path = opts.path;
    request.alternative_key = opts.alternative_key;
    request.new_value = opts.value;
    std::string_view rest = opts.eliminate;
    while (!rest.empty()) {
        size_t comma = rest.find(',');
        auto key = tamper::serde::trim_view(rest.substr(0, comma));
        if (!key.empty()) {
            request.eliminate_keys.emplace(key);
        }
        rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
    }
    std::cout << tamper::resolve_union(*payload, request, cfg) << "\n";
    return 0;
}

int run_match(const options& opts, const tamper::engine_config& cfg) {
    int32_t status = 0;
    const char* code_end = opts.code.data() + opts.code.size();
    auto [ptr, ec] = std::from_chars(opts.code.data(), code_end, status);
    if (opts.code.empty() || ec != std::errc() || ptr != code_end) {
        std::cerr << "[match] --code must be a numeric status code\n";
        return 1;
    }
    std::string body;
    if (!opts.body_file.empty()) {
        auto loaded = read_file(opts.body_file);
        if (!loaded) {
            std::cerr << "[match] cannot read " << opts.body_file << ": "
                      << loaded.error().message() << "\n";
            return 1;
        }
        body = std::move(*loaded);
    }

    tamper::match_settings settings;
    settings.codes = opts.match_codes;
    settings.lines = opts.match_lines;
    settings.words = opts.match_words;
    settings.sizes = opts.match_sizes;
    settings.regex = opts.match_regex;
    settings.match_input = !opts.match_input.empty();

    auto criteria = tamper::build_match_criteria(settings, cfg);
    if (!criteria) {
        std::cerr << "[match] " << criteria.error().message() << "\n";
        return 1;
    }

    auto response = tamper::response_descriptor::from_body(status, std::move(body));
    bool matched = criteria->evaluate(response);
    if (criteria->is_input_reflected(response, opts.match_input)) {
        std::cout << "REFLECTED " << opts.match_input << "\n";
        matched = true;
    }
    std::cout << (matched ? "MATCH" : "NO MATCH") << criteria->describe() << "\n";
    return matched ? 0 : 2;
}

} // namespace

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    auto cfg = make_config(opts);

    if (opts.subcommand == "read") {
        return run_read(opts, cfg);
    }
    if (opts.subcommand == "erase") {
        return run_erase(opts, cfg);
    }
    if (opts.subcommand == "union") {
        return run_union(opts, cfg);
    }
    if (opts.subcommand == "match") {
        return run_match(opts, cfg);
    }

    std::cerr << "Unknown subcommand: " << opts.subcommand << "\n";
    print_usage();
}
