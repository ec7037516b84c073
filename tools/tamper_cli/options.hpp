#pragma once

#include <string>

namespace tamper_cli {

struct options {
    std::string subcommand; // read,erase,union,match
    std::string payload_file;
    std::string path;
    std::string alternative_key;
    std::string value;
    std::string eliminate; // comma separated
    std::string code;
    std::string body_file;
    std::string match_codes;
    std::string match_lines;
    std::string match_words;
    std::string match_sizes;
    std::string match_regex;
    std::string match_input;
    bool verbose = false;
};

[[noreturn]] void print_usage();
options parse_args(int argc, char** argv);

} // namespace tamper_cli
