#pragma once

#include <cstddef>
#include <string>

#include <ddb/value.h>

namespace ddb {

// Field paths used in error messages: keys joined with '.', list positions
// as "[i]", e.g. "orders[2].price".
inline std::string child_path(const std::string& parent, const std::string& key) {
    if (parent.empty()) return key;
    return parent + "." + key;
}

inline std::string index_path(const std::string& parent, size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

// JSON name of a value's kind, for error messages.
inline std::string json_kind(const Value& v) {
    switch (v.type()) {
        case Value::Object:
            return "object";
        case Value::Array:
            return "array";
        case Value::String:
            return "string";
        case Value::Integer:
        case Value::Double:
            return "number";
        case Value::Boolean:
            return "boolean";
        case Value::Null:
            return "null";
    }
    return "unknown";
}

}  // namespace ddb
