#include <ddb/attribute_value.h>
#include <ddb/error.h>
#include <ddb/path.h>
#include <stdexcept>

namespace ddb {

namespace {
    struct TagSpelling {
        Tag tag;
        const char* name;
    };

    const TagSpelling kTags[] = {
        {Tag::String, "S"},     {Tag::Number, "N"},     {Tag::Bool, "BOOL"},
        {Tag::Null, "NULL"},    {Tag::Map, "M"},        {Tag::List, "L"},
        {Tag::StringSet, "SS"}, {Tag::NumberSet, "NS"}, {Tag::BinarySet, "BS"},
        {Tag::Binary, "B"},
    };

    std::string type_mismatch(const char* tag, const char* expected, const Value& got) {
        return std::string(tag) + " expects " + expected + ", got " + json_kind(got);
    }

    NumberLiteral read_number(const Value& payload, const std::string& path, const char* tag) {
        if (not payload.isString())
            throw CodecError(ErrorKind::TypeMismatch, path,
                             type_mismatch(tag, "a number literal in a string", payload));
        auto literal = NumberLiteral::parse(payload.asString());
        if (not literal)
            throw CodecError(ErrorKind::InvalidNumberLiteral, path,
                             "invalid number literal '" + payload.asString() + "'");
        return *literal;
    }

    std::vector<std::string> read_string_set(const Value& payload, const std::string& path,
                                             const char* tag) {
        if (not payload.isArrayObject())
            throw CodecError(ErrorKind::TypeMismatch, path, type_mismatch(tag, "an array of strings", payload));
        std::vector<std::string> out;
        out.reserve(payload.size());
        size_t i = 0;
        for (auto const& el : payload.asArray()) {
            if (not el.isString())
                throw CodecError(ErrorKind::TypeMismatch, index_path(path, i),
                                 std::string(tag) + " elements must be strings, got " + json_kind(el));
            out.push_back(el.asString());
            ++i;
        }
        return out;
    }
}

const char* tag_name(Tag tag) {
    switch (tag) {
        case Tag::String:
            return "S";
        case Tag::Number:
            return "N";
        case Tag::Bool:
            return "BOOL";
        case Tag::Null:
            return "NULL";
        case Tag::Map:
            return "M";
        case Tag::List:
            return "L";
        case Tag::StringSet:
            return "SS";
        case Tag::NumberSet:
            return "NS";
        case Tag::BinarySet:
            return "BS";
        case Tag::Binary:
            return "B";
    }
    throw std::logic_error("Not a valid tag");
}

std::optional<Tag> tag_from_name(const std::string& name) {
    for (auto const& t : kTags) {
        if (name == t.name) return t.tag;
    }
    return std::nullopt;
}

AttributeValue AttributeValue::string(std::string s) { return AttributeValue(Tag::String, std::move(s)); }

AttributeValue AttributeValue::number(NumberLiteral n) { return AttributeValue(Tag::Number, std::move(n)); }

AttributeValue AttributeValue::boolean(bool b) { return AttributeValue(Tag::Bool, b); }

AttributeValue AttributeValue::null() { return AttributeValue(Tag::Null, true); }

AttributeValue AttributeValue::map(Map entries) { return AttributeValue(Tag::Map, std::move(entries)); }

AttributeValue AttributeValue::list(List elements) {
    return AttributeValue(Tag::List, std::move(elements));
}

AttributeValue AttributeValue::stringSet(std::vector<std::string> strings) {
    return AttributeValue(Tag::StringSet, std::move(strings));
}

AttributeValue AttributeValue::numberSet(std::vector<NumberLiteral> numbers) {
    return AttributeValue(Tag::NumberSet, std::move(numbers));
}

AttributeValue AttributeValue::binarySet(std::vector<std::string> base64) {
    return AttributeValue(Tag::BinarySet, std::move(base64));
}

AttributeValue AttributeValue::binary(std::string base64) {
    return AttributeValue(Tag::Binary, std::move(base64));
}

template <typename T>
const T& AttributeValue::payloadAs(Tag expected) const {
    if (my_tag != expected) {
        throw std::logic_error(std::string("attribute is ") + tag_name(my_tag) + ", not " + tag_name(expected));
    }
    return std::get<T>(payload);
}

const std::string& AttributeValue::asString() const { return payloadAs<std::string>(Tag::String); }

const std::string& AttributeValue::asBinary() const { return payloadAs<std::string>(Tag::Binary); }

const NumberLiteral& AttributeValue::asNumber() const { return payloadAs<NumberLiteral>(Tag::Number); }

bool AttributeValue::asBool() const { return payloadAs<bool>(Tag::Bool); }

const AttributeValue::Map& AttributeValue::asMap() const { return payloadAs<Map>(Tag::Map); }

const AttributeValue::List& AttributeValue::asList() const { return payloadAs<List>(Tag::List); }

const std::vector<std::string>& AttributeValue::asStrings() const {
    if (my_tag == Tag::BinarySet) return std::get<std::vector<std::string> >(payload);
    return payloadAs<std::vector<std::string> >(Tag::StringSet);
}

const std::vector<NumberLiteral>& AttributeValue::asNumbers() const {
    return payloadAs<std::vector<NumberLiteral> >(Tag::NumberSet);
}

AttributeValue AttributeValue::fromJson(const Value& json, const std::string& path) {
    if (not json.isMappedObject()) {
        throw CodecError(ErrorKind::MalformedTagObject, path,
                         "expected a DynamoDB type object such as {\"S\": ...}, got " + json_kind(json));
    }
    if (json.size() != 1) {
        std::string found;
        for (auto const& k : json.keys()) found += (found.empty() ? "" : ", ") + k;
        throw CodecError(ErrorKind::MalformedTagObject, path,
                         "DynamoDB type object must have exactly one key, found " +
                                     std::to_string(json.size()) + (found.empty() ? "" : " (" + found + ")"));
    }

    const std::string key = json.keys().front();
    auto tag = tag_from_name(key);
    if (not tag) throw CodecError(ErrorKind::UnknownTag, path, "unknown type descriptor '" + key + "'");

    const Value& payload = json.at(key);
    switch (*tag) {
        case Tag::String:
            if (not payload.isString())
                throw CodecError(ErrorKind::TypeMismatch, path, type_mismatch("S", "a string", payload));
            return string(payload.asString());
        case Tag::Number:
            return number(read_number(payload, path, "N"));
        case Tag::Bool:
            if (not payload.isBool())
                throw CodecError(ErrorKind::TypeMismatch, path, type_mismatch("BOOL", "a boolean", payload));
            return boolean(payload.asBool());
        case Tag::Null:
            return null();
        case Tag::Map: {
            if (not payload.isMappedObject())
                throw CodecError(ErrorKind::TypeMismatch, path, type_mismatch("M", "an object", payload));
            Map entries;
            entries.reserve(payload.size());
            for (auto const& k : payload.keys()) entries.emplace_back(k, fromJson(payload.at(k), child_path(path, k)));
            return map(std::move(entries));
        }
        case Tag::List: {
            if (not payload.isArrayObject())
                throw CodecError(ErrorKind::TypeMismatch, path, type_mismatch("L", "an array", payload));
            List elements;
            elements.reserve(payload.size());
            size_t i = 0;
            for (auto const& el : payload.asArray()) elements.push_back(fromJson(el, index_path(path, i++)));
            return list(std::move(elements));
        }
        case Tag::StringSet:
            return stringSet(read_string_set(payload, path, "SS"));
        case Tag::NumberSet: {
            if (not payload.isArrayObject())
                throw CodecError(ErrorKind::TypeMismatch, path,
                                 type_mismatch("NS", "an array of number literals", payload));
            std::vector<NumberLiteral> numbers;
            numbers.reserve(payload.size());
            size_t i = 0;
            for (auto const& el : payload.asArray()) numbers.push_back(read_number(el, index_path(path, i++), "NS"));
            return numberSet(std::move(numbers));
        }
        case Tag::BinarySet:
            return binarySet(read_string_set(payload, path, "BS"));
        case Tag::Binary:
            if (not payload.isString())
                throw CodecError(ErrorKind::TypeMismatch, path,
                                 type_mismatch("B", "a base64 string", payload));
            return binary(payload.asString());
    }
    throw CodecError(ErrorKind::UnknownTag, path, "unknown type descriptor '" + key + "'");
}

Value AttributeValue::toJson() const {
    Value out;
    Value& body = out[tag_name(my_tag)];
    switch (my_tag) {
        case Tag::String:
        case Tag::Binary:
            body = std::get<std::string>(payload);
            break;
        case Tag::Number:
            body = std::get<NumberLiteral>(payload).text();
            break;
        case Tag::Bool:
            body = std::get<bool>(payload);
            break;
        case Tag::Null:
            body = true;
            break;
        case Tag::Map: {
            Value m;
            for (auto const& entry : std::get<Map>(payload)) m[entry.first] = entry.second.toJson();
            body = std::move(m);
            break;
        }
        case Tag::List: {
            Value l = Value::array();
            for (auto const& el : std::get<List>(payload)) l.push_back(el.toJson());
            body = std::move(l);
            break;
        }
        case Tag::StringSet:
        case Tag::BinarySet: {
            Value l = Value::array();
            for (auto const& s : std::get<std::vector<std::string> >(payload)) l.push_back(s);
            body = std::move(l);
            break;
        }
        case Tag::NumberSet: {
            Value l = Value::array();
            for (auto const& n : std::get<std::vector<NumberLiteral> >(payload)) l.push_back(n.text());
            body = std::move(l);
            break;
        }
    }
    return out;
}

}  // namespace ddb
