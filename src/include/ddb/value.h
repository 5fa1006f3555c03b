#pragma once

#include <cstdint>
#include <cstdio>
#include <functional>
#include <initializer_list>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ddb/number_format.h>

namespace ddb {

struct ValueScalarImpl {
    bool m_bool = false;
    double m_double = 0.0;
    int64_t m_int = 0;
    std::string m_string = "";
};

// A plain JSON value. Objects remember the order their keys were first
// inserted in, so a document serializes back in the order it was read.
struct Value {
    enum TYPE { Object, Array, String, Integer, Double, Boolean, Null };

  private:
    TYPE my_type = Object;
    ValueScalarImpl scalar;

    std::vector<Value> m_array;
    std::vector<std::string> m_keys;
    std::map<std::string, Value> m_object_map;

  public:
    Value() { my_type = TYPE::Object; }

    Value(const std::string& s) {
        my_type = TYPE::String;
        scalar.m_string = s;
    }

    Value(std::string&& s) {
        my_type = TYPE::String;
        scalar.m_string = std::move(s);
    }

    Value(const char* s) : Value(std::string(s)) {}

    Value(int64_t n) {
        my_type = TYPE::Integer;
        scalar.m_int = n;
    }

    Value(int n) : Value(int64_t(n)) {}

    Value(double x) {
        my_type = TYPE::Double;
        scalar.m_double = x;
    }

    Value(bool b) {
        my_type = TYPE::Boolean;
        scalar.m_bool = b;
    }

    Value(std::vector<Value> v) {
        my_type = TYPE::Array;
        m_array = std::move(v);
    }

    // Construct an object from initializer list of (key, value) pairs
    Value(std::initializer_list<std::pair<std::string, Value> > init) {
        my_type = TYPE::Object;
        for (auto const& p : init) (*this)[p.first] = p.second;
    }

    static Value null() {
        Value v;
        v.my_type = TYPE::Null;
        return v;
    }

    static Value array(std::vector<Value> items = {}) { return Value(std::move(items)); }

    bool operator==(const Value& rhs) const {
        if (my_type != rhs.my_type) return false;
        switch (my_type) {
            case TYPE::Boolean:
                return scalar.m_bool == rhs.scalar.m_bool;
            case TYPE::Double:
                return scalar.m_double == rhs.scalar.m_double;
            case TYPE::Integer:
                return scalar.m_int == rhs.scalar.m_int;
            case TYPE::String:
                return scalar.m_string == rhs.scalar.m_string;
            case TYPE::Array:
                return m_array == rhs.m_array;
            case TYPE::Object: {
                // key order is presentation only
                if (m_object_map.size() != rhs.m_object_map.size()) return false;
                for (auto const& p : m_object_map) {
                    auto it = rhs.m_object_map.find(p.first);
                    if (it == rhs.m_object_map.end()) return false;
                    if (p.second != it->second) return false;
                }
                return true;
            }
            case TYPE::Null:
                return true;
        }
        return false;
    }

    bool operator!=(const Value& rhs) const { return not(*this == rhs); }

    int count(const std::string& key) const {
        if (my_type != TYPE::Object) return 0;
        return static_cast<int>(m_object_map.count(key));
    }

    bool has(const std::string& key) const noexcept { return count(key) == 1; }
    bool contains(const std::string& k) const noexcept { return has(k); }

    size_t size() const noexcept {
        switch (my_type) {
            case TYPE::Array:
                return m_array.size();
            case TYPE::Object:
                return m_object_map.size();
            default:
                return 0;
        }
    }

    bool empty() const noexcept { return size() == 0; }

    Value& erase(const std::string& k) {
        if (my_type == TYPE::Object and m_object_map.erase(k) == 1) {
            for (auto it = m_keys.begin(); it != m_keys.end(); ++it) {
                if (*it == k) {
                    m_keys.erase(it);
                    break;
                }
            }
        }
        return *this;
    }

    void clear() noexcept {
        m_object_map.clear();
        m_keys.clear();
        m_array.clear();
        my_type = TYPE::Object;
    }

    TYPE type() const { return my_type; }

    std::string typeString() const {
        switch (my_type) {
            case TYPE::Object:
                return "Object";
            case TYPE::Array:
                return "Array";
            case TYPE::String:
                return "String";
            case TYPE::Integer:
                return "Integer";
            case TYPE::Double:
                return "Double";
            case TYPE::Boolean:
                return "Boolean";
            case TYPE::Null:
                return "Null";
        }
        throw std::logic_error("Not a valid type");
    }

    // Mutable key access turns a non-object into an empty object first, so
    // `v["a"]["b"] = 1` builds nested objects naturally. Assigning to a key
    // that already exists keeps its original position.
    Value& operator[](const std::string& k) {
        if (my_type != TYPE::Object) {
            clear();
            my_type = TYPE::Object;
        }
        auto it = m_object_map.find(k);
        if (it != m_object_map.end()) return it->second;
        m_keys.push_back(k);
        return m_object_map[k];
    }

    const Value& operator[](const std::string& k) const { return at(k); }

    Value& push_back(Value v) {
        if (my_type == TYPE::Object and m_object_map.empty()) my_type = TYPE::Array;
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        m_array.push_back(std::move(v));
        return m_array.back();
    }

    const Value& at(size_t index) const {
        if (my_type != TYPE::Array) throw std::logic_error("Not a list");
        if (index >= m_array.size()) {
            throw std::out_of_range("Index " + std::to_string(index) + " out of range for list of size " +
                                    std::to_string(m_array.size()));
        }
        return m_array[index];
    }

    Value& at(size_t index) {
        return const_cast<Value&>(static_cast<const Value&>(*this).at(index));
    }

    const Value& at(const std::string& k) const {
        auto it = m_object_map.find(k);
        if (it != m_object_map.end()) return it->second;

        // didn't find it, throw a decent error message
        std::ostringstream ss;
        ss << "Could not find key <" << k << "> available options are: ";
        bool first = true;
        for (auto const& key : m_keys) {
            if (!first) ss << ",";
            first = false;
            ss << '"' << key << '"';
        }
        throw std::out_of_range(ss.str());
    }

    Value& at(const std::string& k) {
        return const_cast<Value&>(static_cast<const Value&>(*this).at(k));
    }

    // Keys in insertion order.
    std::vector<std::string> keys() const {
        if (my_type != TYPE::Object) return {};
        return m_keys;
    }

    std::vector<std::pair<std::string, Value> > items() const {
        if (my_type != TYPE::Object) {
            throw std::logic_error("Cannot get items of non-object type");
        }
        std::vector<std::pair<std::string, Value> > out;
        out.reserve(m_keys.size());
        for (auto const& k : m_keys) out.emplace_back(k, m_object_map.at(k));
        return out;
    }

    const std::vector<Value>& asArray() const {
        if (my_type != TYPE::Array) throw std::runtime_error("not a list");
        return m_array;
    }

    const std::string& asString() const {
        if (my_type != TYPE::String) throw std::runtime_error("not a string");
        return scalar.m_string;
    }

    int64_t asInt() const {
        if (my_type == TYPE::Integer) return scalar.m_int;
        if (my_type == TYPE::Double) return static_cast<int64_t>(scalar.m_double);
        throw std::runtime_error("not an int");
    }

    double asDouble() const {
        if (my_type == TYPE::Double) return scalar.m_double;
        if (my_type == TYPE::Integer) return static_cast<double>(scalar.m_int);
        throw std::runtime_error("not a double");
    }

    bool asBool() const {
        if (my_type == TYPE::Boolean) return scalar.m_bool;
        throw std::runtime_error("not a bool");
    }

    bool isMappedObject() const { return my_type == TYPE::Object; }
    bool isArrayObject() const { return my_type == TYPE::Array; }
    bool isInt() const { return my_type == TYPE::Integer; }
    bool isDouble() const { return my_type == TYPE::Double; }
    bool isNumber() const { return isInt() or isDouble(); }
    bool isString() const { return my_type == TYPE::String; }
    bool isBool() const { return my_type == TYPE::Boolean; }
    bool isNull() const { return my_type == TYPE::Null; }

    // Serialize as JSON. indent == 0 gives a single compact line; a positive
    // indent puts each member and element on its own line.
    std::string dump(int indent = 0) const;
};

// Helper function to escape JSON strings
static inline std::string escape_json_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    result += buf;
                } else {
                    result.push_back(c);
                }
                break;
        }
    }
    result.push_back('"');
    return result;
}

inline std::string Value::dump(int indent) const {
    std::ostringstream out;
    const bool pretty = indent > 0;
    auto pad = [&](int level) { out << std::string(static_cast<size_t>(level), ' '); };

    std::function<void(const Value&, int)> dumpValue;
    dumpValue = [&](const Value& val, int level) {
        switch (val.my_type) {
            case TYPE::Null:
                out << "null";
                return;
            case TYPE::Boolean:
                out << (val.scalar.m_bool ? "true" : "false");
                return;
            case TYPE::Integer:
                out << val.scalar.m_int;
                return;
            case TYPE::Double:
                out << format_double(val.scalar.m_double);
                return;
            case TYPE::String:
                out << escape_json_string(val.scalar.m_string);
                return;
            case TYPE::Array: {
                if (val.m_array.empty()) {
                    out << "[]";
                    return;
                }
                out << (pretty ? "[\n" : "[");
                for (size_t i = 0; i < val.m_array.size(); ++i) {
                    if (i) out << (pretty ? ",\n" : ",");
                    if (pretty) pad(level + indent);
                    dumpValue(val.m_array[i], level + indent);
                }
                if (pretty) {
                    out << "\n";
                    pad(level);
                }
                out << "]";
                return;
            }
            case TYPE::Object: {
                if (val.m_keys.empty()) {
                    out << "{}";
                    return;
                }
                out << (pretty ? "{\n" : "{");
                bool first = true;
                for (auto const& k : val.m_keys) {
                    if (!first) out << (pretty ? ",\n" : ",");
                    first = false;
                    if (pretty) pad(level + indent);
                    out << escape_json_string(k) << (pretty ? ": " : ":");
                    dumpValue(val.m_object_map.at(k), level + indent);
                }
                if (pretty) {
                    out << "\n";
                    pad(level);
                }
                out << "}";
                return;
            }
        }
    };

    dumpValue(*this, 0);
    return out.str();
}

inline std::ostream& operator<<(std::ostream& os, const Value& v) {
    os << v.dump();
    return os;
}

}  // namespace ddb
