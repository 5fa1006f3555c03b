#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace ddb {
namespace convert {

enum class Mode {
    FromDdb,  // DynamoDB JSON -> plain JSON
    ToDdb     // plain JSON -> DynamoDB JSON
};

enum class Framing {
    Auto,      // decide from the input path and the first line
    Json,      // the whole input is one document
    JsonLines  // one document per line, blank lines skipped
};

struct ConvertOptions {
    Mode mode = Mode::FromDdb;
    bool pretty = false;
    bool wrap_item = true;    // to-ddb only
    bool bare_value = false;  // from-ddb only: units are single attribute values
    bool keep_going = false;  // JSON Lines only
    Framing framing = Framing::Auto;
    bool verbose = false;
};

struct RunResult {
    size_t converted = 0;
    size_t failed = 0;
    std::string first_error;

    bool ok() const { return failed == 0; }
};

// A ".jsonl" path means JSON Lines. Otherwise the first line decides: if it
// is a complete JSON value on its own the input is JSON Lines, else it is a
// single (possibly multi-line) document.
Framing detect_framing(const std::string& first_line, const std::string& path_hint = "");

std::string to_string(Framing framing);

// Runs conversions according to `ConvertOptions`. Holds no state between
// units; each line or document is converted on its own.
class Converter {
  public:
    explicit Converter(ConvertOptions options);

    const ConvertOptions& options() const { return options_; }

    // Parse, convert and serialize one unit (no trailing newline). Throws
    // JsonParseError or CodecError.
    std::string convertText(const std::string& text) const;

    // Convert everything read from `in`, writing results to `out` and
    // diagnostics to `log`. `path_hint` is the input file name, if any, for
    // framing detection.
    RunResult run(std::istream& in, std::ostream& out, std::ostream& log,
                  const std::string& path_hint = "") const;

  private:
    RunResult runDocument(const std::string& text, std::ostream& out, std::ostream& log) const;
    RunResult runLines(std::istream& in, const std::string& first_line, bool have_first_line,
                       std::ostream& out, std::ostream& log) const;

    ConvertOptions options_;
};

}  // namespace convert
}  // namespace ddb
