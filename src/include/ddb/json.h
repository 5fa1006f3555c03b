#pragma once

#include <ddb/value.h>
#include <stdexcept>
#include <string>

namespace ddb {

struct JsonParseError : public std::runtime_error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c)
        : std::runtime_error(msg), line(l), col(c) {}
};

// Strict RFC 8259 parser. Throws JsonParseError with the line, column and
// a caret under the offending character.
Value parse_json(const std::string& text);

// True iff `probe_text` holds exactly one complete JSON value (surrounding
// whitespace allowed). Blank text is not a value.
bool looks_like_single_json_value(const std::string& probe_text);

namespace json_literals {
    inline Value operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

}  // namespace ddb
