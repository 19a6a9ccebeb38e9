#include <od/cli_args.h>
#include <od/cli_utils.h>

#include <stdexcept>
#include <string>

namespace od {
namespace cli {

namespace {
    int parse_indent(const std::string& text) {
        size_t used = 0;
        int n = -1;
        try {
            n = std::stoi(text, &used);
        } catch (const std::exception&) {
            throw std::invalid_argument("--indent expects a non-negative integer, got '" + text +
                                        "'");
        }
        if (used != text.size() or n < 0)
            throw std::invalid_argument("--indent expects a non-negative integer, got '" + text +
                                        "'");
        return n;
    }
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    static const std::vector<std::string> valid_options = {
                "--shallow", "--indent", "--output", "-o", "--verbose", "-v", "--help", "-h"};

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        } else if (arg == "--shallow") {
            recursive_ = false;
        } else if (arg == "--indent") {
            if (i + 1 >= argc) throw std::invalid_argument("--indent requires a value");
            indent_ = parse_indent(argv[++i]);
        } else if (arg == "--output" || arg == "-o") {
            if (i + 1 >= argc) throw std::invalid_argument("--output requires a path argument");
            output_ = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose_ = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument(cli_utils::unknown_option_message(arg, valid_options));
        } else {
            inputs_.push_back(arg);
        }
    }

    if (inputs_.empty()) throw std::invalid_argument("no input files given");
    action_ = Action::MERGE;
}

std::string CliArgs::usage() {
    return "usage:\n"
           "  odict-merge [options] <file.json> [<file.json> ...]\n"
           "\n"
           "Merges the JSON documents left to right and prints the result.\n"
           "\n"
           "options:\n"
           "  --shallow         overwrite top-level keys instead of merging recursively\n"
           "  --indent N        indentation width, 0 for a single line (default 4)\n"
           "  -o, --output P    write to P instead of stdout\n"
           "  -v, --verbose     report each step on stderr\n"
           "  -h, --help        show this message\n";
}

}  // namespace cli
}  // namespace od
