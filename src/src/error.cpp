#include <ddb/error.h>
#include <utility>

namespace ddb {

namespace {
    std::string compose_message(const std::string& path, const std::string& detail) {
        if (path.empty()) return detail;
        return path + ": " + detail;
    }
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedTagObject:
            return "MalformedTagObject";
        case ErrorKind::UnknownTag:
            return "UnknownTag";
        case ErrorKind::InvalidNumberLiteral:
            return "InvalidNumberLiteral";
        case ErrorKind::TypeMismatch:
            return "TypeMismatch";
        case ErrorKind::UnsupportedValueKind:
            return "UnsupportedValueKind";
    }
    return "Unknown";
}

CodecError::CodecError(ErrorKind kind, std::string path, std::string detail)
    : std::runtime_error(compose_message(path, detail)),
      kind_(kind),
      path_(std::move(path)),
      detail_(std::move(detail)) {}

}  // namespace ddb
