#include <ddb/convert/cli_args.h>
#include <ddb/cli_utils.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace ddb {
namespace convert {

CliArgs::CliArgs(int argc, const char* argv[]) {
    if (argc < 2) {
        action_ = Action::HELP;
        return;
    }

    static const std::vector<std::string> valid_modes = {"from-ddb", "to-ddb"};

    // Valid options for error suggestions
    static const std::vector<std::string> valid_options = {
        "--input", "-i",
        "--output", "-o",
        "--pretty", "-p",
        "--without-item",
        "--value",
        "--json",
        "--jsonl",
        "--keep-going", "-k",
        "--verbose", "-v",
        "--help", "-h"
    };

    bool have_mode = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        }
        else if (arg == "--input" || arg == "-i") {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a file argument");
            }
            inputPath_ = argv[++i];
        }
        else if (arg == "--output" || arg == "-o") {
            if (i + 1 >= argc) {
                throw std::invalid_argument(arg + " requires a file argument");
            }
            outputPath_ = argv[++i];
        }
        else if (arg == "--pretty" || arg == "-p") {
            options_.pretty = true;
        }
        else if (arg == "--without-item") {
            options_.wrap_item = false;
        }
        else if (arg == "--value") {
            options_.bare_value = true;
        }
        else if (arg == "--json") {
            options_.framing = Framing::Json;
        }
        else if (arg == "--jsonl") {
            options_.framing = Framing::JsonLines;
        }
        else if (arg == "--keep-going" || arg == "-k") {
            options_.keep_going = true;
        }
        else if (arg == "--verbose" || arg == "-v") {
            options_.verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument(cli_utils::unknown_word_error("argument", arg, valid_options));
        }
        else if (have_mode) {
            throw std::invalid_argument("Unexpected argument: " + arg + " (mode already given)");
        }
        else if (arg == "from-ddb") {
            options_.mode = Mode::FromDdb;
            have_mode = true;
        }
        else if (arg == "to-ddb") {
            options_.mode = Mode::ToDdb;
            have_mode = true;
        }
        else {
            throw std::invalid_argument(cli_utils::unknown_word_error("mode", arg, valid_modes));
        }
    }

    if (!have_mode) {
        throw std::invalid_argument("missing conversion mode (expected 'from-ddb' or 'to-ddb')");
    }
    action_ = Action::CONVERT;
}

}  // namespace convert
}  // namespace ddb
