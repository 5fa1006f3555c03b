#include <ddb/codec.h>
#include <ddb/path.h>
#include <stdexcept>

namespace ddb {

namespace {
    constexpr const char* kItemKey = "Item";

    Value number_to_value(const NumberLiteral& n, const std::string& path) {
        try {
            return n.toValue();
        } catch (const std::out_of_range& e) {
            throw CodecError(ErrorKind::InvalidNumberLiteral, path, e.what());
        } catch (const std::invalid_argument& e) {
            throw CodecError(ErrorKind::InvalidNumberLiteral, path, e.what());
        }
    }

    void require_object(const Value& v, const char* what) {
        if (not v.isMappedObject())
            throw CodecError(ErrorKind::TypeMismatch, "",
                             std::string("expected a JSON object as the ") + what + ", got " + json_kind(v));
    }
}

Value unmarshall_value(const AttributeValue& value, const std::string& path) {
    switch (value.tag()) {
        case Tag::String:
            return Value(value.asString());
        case Tag::Number:
            return number_to_value(value.asNumber(), path);
        case Tag::Bool:
            return Value(value.asBool());
        case Tag::Null:
            return Value::null();
        case Tag::Map: {
            Value out;
            for (auto const& entry : value.asMap())
                out[entry.first] = unmarshall_value(entry.second, child_path(path, entry.first));
            return out;
        }
        case Tag::List: {
            Value out = Value::array();
            size_t i = 0;
            for (auto const& el : value.asList()) out.push_back(unmarshall_value(el, index_path(path, i++)));
            return out;
        }
        case Tag::StringSet:
        case Tag::BinarySet: {
            Value out = Value::array();
            for (auto const& s : value.asStrings()) out.push_back(s);
            return out;
        }
        case Tag::NumberSet: {
            Value out = Value::array();
            size_t i = 0;
            for (auto const& n : value.asNumbers()) out.push_back(number_to_value(n, index_path(path, i++)));
            return out;
        }
        case Tag::Binary:
            return Value(value.asBinary());
    }
    throw CodecError(ErrorKind::UnknownTag, path, "unhandled type descriptor");
}

Value unmarshall_value(const Value& tagged_json) {
    return unmarshall_value(AttributeValue::fromJson(tagged_json));
}

Value unmarshall_item(const Value& document) {
    require_object(document, "item");
    const Value& item = is_item_envelope(document) ? document.at(kItemKey) : document;

    Value out;
    for (auto const& key : item.keys())
        out[key] = unmarshall_value(AttributeValue::fromJson(item.at(key), key), key);
    return out;
}

Value from_tagged(const Value& document) { return unmarshall_item(document); }

AttributeValue marshall_value(const Value& value, const std::string& path) {
    switch (value.type()) {
        case Value::Null:
            return AttributeValue::null();
        case Value::Boolean:
            return AttributeValue::boolean(value.asBool());
        case Value::Integer:
            return AttributeValue::number(NumberLiteral::fromInteger(value.asInt()));
        case Value::Double:
            try {
                return AttributeValue::number(NumberLiteral::fromDouble(value.asDouble()));
            } catch (const std::domain_error& e) {
                throw CodecError(ErrorKind::InvalidNumberLiteral, path, e.what());
            }
        case Value::String:
            return AttributeValue::string(value.asString());
        case Value::Array: {
            AttributeValue::List elements;
            elements.reserve(value.size());
            size_t i = 0;
            for (auto const& el : value.asArray()) elements.push_back(marshall_value(el, index_path(path, i++)));
            return AttributeValue::list(std::move(elements));
        }
        case Value::Object: {
            AttributeValue::Map entries;
            entries.reserve(value.size());
            for (auto const& key : value.keys())
                entries.emplace_back(key, marshall_value(value.at(key), child_path(path, key)));
            return AttributeValue::map(std::move(entries));
        }
    }
    throw CodecError(ErrorKind::UnsupportedValueKind, path,
                     "no DynamoDB encoding for value kind " + std::to_string(static_cast<int>(value.type())));
}

Value marshall_item(const Value& item, bool wrap) {
    require_object(item, "item");
    Value encoded;
    for (auto const& key : item.keys()) encoded[key] = marshall_value(item.at(key), key).toJson();
    return wrap ? wrap_item(encoded) : encoded;
}

Value to_tagged(const Value& input, bool wrap) {
    if (input.isMappedObject()) return marshall_item(input, wrap);
    return marshall_value(input).toJson();
}

bool is_item_envelope(const Value& document) {
    return document.isMappedObject() and document.size() == 1 and document.has(kItemKey) and
           document.at(kItemKey).isMappedObject();
}

Value unwrap_item(const Value& document) {
    if (is_item_envelope(document)) return document.at(kItemKey);
    return document;
}

Value wrap_item(const Value& item) {
    Value out;
    out[kItemKey] = item;
    return out;
}

}  // namespace ddb
