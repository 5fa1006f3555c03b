#pragma once

#include <stdexcept>
#include <string>

namespace ddb {

enum class ErrorKind {
    MalformedTagObject,    // not a mapping, or not exactly one key
    UnknownTag,            // key outside S N BOOL NULL M L SS NS BS B
    InvalidNumberLiteral,  // N/NS payload that is not a usable decimal literal
    TypeMismatch,          // payload shape does not fit its tag
    UnsupportedValueKind   // value kind the encoder has no rule for
};

std::string to_string(ErrorKind kind);

// Failure to convert one value. `path` locates the field inside the item,
// e.g. `profile.tags[1]`; it is empty when the root itself is at fault.
class CodecError : public std::runtime_error {
  public:
    CodecError(ErrorKind kind, std::string path, std::string detail);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& path() const noexcept { return path_; }
    const std::string& detail() const noexcept { return detail_; }

  private:
    ErrorKind kind_;
    std::string path_;
    std::string detail_;
};

}  // namespace ddb
