#include <ddb/convert/converter.h>
#include <ddb/codec.h>
#include <ddb/json.h>
#include <iterator>
#include <utility>

namespace ddb {
namespace convert {

namespace {
    bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() and s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::string trim(const std::string& s) {
        const char* ws = " \t\r\n";
        size_t a = s.find_first_not_of(ws);
        if (a == std::string::npos) return "";
        size_t b = s.find_last_not_of(ws);
        return s.substr(a, b - a + 1);
    }

    void record_failure(RunResult& result, const std::string& message, std::ostream& log) {
        ++result.failed;
        if (result.first_error.empty()) result.first_error = message;
        log << "Error: " << message << "\n";
    }
}

Framing detect_framing(const std::string& first_line, const std::string& path_hint) {
    if (ends_with(path_hint, ".jsonl")) return Framing::JsonLines;
    return looks_like_single_json_value(first_line) ? Framing::JsonLines : Framing::Json;
}

std::string to_string(Framing framing) {
    switch (framing) {
        case Framing::Auto:
            return "auto";
        case Framing::Json:
            return "JSON";
        case Framing::JsonLines:
            return "JSON Lines";
    }
    return "unknown";
}

Converter::Converter(ConvertOptions options) : options_(std::move(options)) {}

std::string Converter::convertText(const std::string& text) const {
    Value input = parse_json(text);
    Value output;
    switch (options_.mode) {
        case Mode::FromDdb:
            output = options_.bare_value ? unmarshall_value(input) : from_tagged(input);
            break;
        case Mode::ToDdb:
            output = to_tagged(input, options_.wrap_item);
            break;
    }
    return output.dump(options_.pretty ? 2 : 0);
}

RunResult Converter::run(std::istream& in, std::ostream& out, std::ostream& log,
                         const std::string& path_hint) const {
    std::string first_line;
    bool have_first_line = static_cast<bool>(std::getline(in, first_line));

    Framing framing = options_.framing;
    if (framing == Framing::Auto) {
        framing = detect_framing(first_line, path_hint);
        if (options_.verbose) {
            log << "ddbconv: detected " << to_string(framing) << " input"
                << (ends_with(path_hint, ".jsonl") ? " (from .jsonl extension)" : " (from first line)") << "\n";
        }
    } else if (options_.verbose) {
        log << "ddbconv: using " << to_string(framing) << " input\n";
    }

    RunResult result;
    if (framing == Framing::JsonLines) {
        result = runLines(in, first_line, have_first_line, out, log);
    } else {
        std::string text = first_line;
        if (have_first_line and not in.eof()) text.push_back('\n');
        text.append(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        result = runDocument(text, out, log);
    }

    if (options_.verbose) {
        log << "ddbconv: " << result.converted << " converted, " << result.failed << " failed\n";
    }
    return result;
}

RunResult Converter::runDocument(const std::string& text, std::ostream& out, std::ostream& log) const {
    RunResult result;
    try {
        std::string converted = convertText(text);
        out << converted << "\n";
        ++result.converted;
    } catch (const JsonParseError& e) {
        record_failure(result, std::string("Invalid JSON: ") + e.what(), log);
    } catch (const CodecError& e) {
        record_failure(result, e.what(), log);
    }
    return result;
}

RunResult Converter::runLines(std::istream& in, const std::string& first_line, bool have_first_line,
                              std::ostream& out, std::ostream& log) const {
    RunResult result;
    std::string line = first_line;
    bool have_line = have_first_line;
    size_t line_number = 0;

    while (have_line) {
        ++line_number;
        std::string unit = trim(line);
        if (not unit.empty()) {
            const size_t failed_before = result.failed;
            try {
                std::string converted = convertText(unit);
                out << converted << "\n";
                ++result.converted;
            } catch (const JsonParseError& e) {
                record_failure(result, "Invalid JSON on line " + std::to_string(line_number) + ": " + e.what(),
                               log);
            } catch (const CodecError& e) {
                record_failure(result, "line " + std::to_string(line_number) + ": " + e.what(), log);
            }
            if (result.failed > failed_before and not options_.keep_going) break;
        }
        have_line = static_cast<bool>(std::getline(in, line));
    }
    return result;
}

}  // namespace convert
}  // namespace ddb
