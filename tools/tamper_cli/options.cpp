#include "options.hpp"

#include <cstdlib>
#include <iostream>
#include <string_view>

namespace tamper_cli {

[[noreturn]] void print_usage() {
    std::cout << R"(tamper - payload mutation and response matching

Usage:
  tamper read  -p <payload> --path <field>
  tamper erase -p <payload> --path <field>
  tamper union -p <payload> --path <target> --alt <key> --value <json> [--eliminate a,b]
  tamper match --code <status> --body <file> [match options]

Options:
  -p, --payload <file>       JSON payload to work on
  --path <field>             Field path ('#' or '.' separated, $[0]# / $[*]# for root arrays)
  --alt <key>                Union alternative that survives the collapse
  --value <json>             Replacement JSON fragment
  --eliminate <keys>         Comma separated sibling alternatives to delete
  --code <status>            Response status code
  --body <file>              Response body
  --mc <codes>               Match response codes, e.g. 200,4XX
  --ml <counts>              Match number of lines
  --mw <counts>              Match number of words
  --ms <sizes>               Match response sizes in bytes
  --mr <regex>               Match the whole body against a regex
  --mi <value>               Report when <value> is reflected in the body
  --verbose                  Trace diagnostics to stderr
  -h, --help                 Show this help
)";
    std::exit(1);
}

options parse_args(int argc, char** argv) {
    options opts;
    if (argc < 2) {
        print_usage();
    }
    opts.subcommand = argv[1];
    if (opts.subcommand == "-h" || opts.subcommand == "--help") {
        print_usage();
    }
    auto next = [&](int& i) -> std::string {
        if (i + 1 >= argc) {
            print_usage();
        }
        return argv[++i];
    };
    for (int i = 2; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
        } else if (arg == "-p" || arg == "--payload") {
            opts.payload_file = next(i);
        } else if (arg == "--path") {
            opts.path = next(i);
        } else if (arg == "--alt") {
            opts.alternative_key = next(i);
        } else if (arg == "--value") {
            opts.value = next(i);
        } else if (arg == "--eliminate") {
            opts.eliminate = next(i);
        } else if (arg == "--code") {
            opts.code = next(i);
        } else if (arg == "--body") {
            opts.body_file = next(i);
        } else if (arg == "--mc") {
            opts.match_codes = next(i);
        } else if (arg == "--ml") {
            opts.match_lines = next(i);
        } else if (arg == "--mw") {
            opts.match_words = next(i);
        } else if (arg == "--ms") {
            opts.match_sizes = next(i);
        } else if (arg == "--mr") {
            opts.match_regex = next(i);
        } else if (arg == "--mi") {
            opts.match_input = next(i);
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
        }
    }
    return opts;
}

} // namespace tamper_cli
