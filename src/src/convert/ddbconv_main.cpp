// ddbconv - convert between DynamoDB JSON and plain JSON

#include <ddb/convert/cli_args.h>
#include <ddb/convert/converter.h>

#include <fstream>
#include <iostream>
#include <stdexcept>

void showHelp() {
    std::cout << "ddbconv - convert between DynamoDB JSON and plain JSON\n\n";
    std::cout << "Usage:\n";
    std::cout << "  ddbconv <from-ddb|to-ddb> [-i <file>] [-o <file>] [options]\n\n";
    std::cout << "Modes:\n";
    std::cout << "  from-ddb             DynamoDB JSON -> plain JSON\n";
    std::cout << "  to-ddb               plain JSON -> DynamoDB JSON\n\n";
    std::cout << "Options:\n";
    std::cout << "  --input, -i <file>   Input file (stdin if omitted)\n";
    std::cout << "  --output, -o <file>  Output file (stdout if omitted)\n";
    std::cout << "  --pretty, -p         Pretty-print output JSON\n";
    std::cout << "  --without-item       to-ddb: omit the top-level \"Item\" wrapper\n";
    std::cout << "  --value              from-ddb: each input is one attribute value, e.g. {\"N\":\"1\"}\n";
    std::cout << "  --json               Treat the input as one JSON document\n";
    std::cout << "  --jsonl              Treat the input as JSON Lines\n";
    std::cout << "  --keep-going, -k     JSON Lines: report bad lines and continue\n";
    std::cout << "  --verbose, -v        Log framing and counts to stderr\n";
    std::cout << "  --help, -h           Show this help\n\n";
    std::cout << "Input framing:\n";
    std::cout << "  A .jsonl input file, or input whose first line is a complete JSON value,\n";
    std::cout << "  is read as JSON Lines. Anything else is read as a single document.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  ddbconv from-ddb -i export.json -p\n";
    std::cout << "  aws dynamodb get-item ... | ddbconv from-ddb\n";
    std::cout << "  ddbconv to-ddb -i items.jsonl -o items-ddb.jsonl --without-item\n";
}

int main(int argc, const char* argv[]) {
    std::ios::sync_with_stdio(false);

    try {
        ddb::convert::CliArgs args(argc, argv);

        if (args.getAction() == ddb::convert::CliArgs::Action::HELP) {
            showHelp();
            return 0;
        }

        std::ifstream in_file;
        if (args.hasInputPath()) {
            in_file.open(args.getInputPath());
            if (!in_file) {
                std::cerr << "Error: cannot open input file: " << args.getInputPath() << "\n";
                return 2;
            }
        }
        std::istream& in = args.hasInputPath() ? static_cast<std::istream&>(in_file) : std::cin;

        std::ofstream out_file;
        if (args.hasOutputPath()) {
            out_file.open(args.getOutputPath());
            if (!out_file) {
                std::cerr << "Error: cannot open output file: " << args.getOutputPath() << "\n";
                return 2;
            }
        }
        std::ostream& out = args.hasOutputPath() ? static_cast<std::ostream&>(out_file) : std::cout;

        ddb::convert::Converter converter(args.getOptions());
        auto result = converter.run(in, out, std::cerr, args.getInputPath());

        out.flush();
        if (!out) {
            std::cerr << "Error: failed to write output\n";
            return 1;
        }
        return result.ok() ? 0 : 1;

    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Run 'ddbconv --help' for usage.\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
