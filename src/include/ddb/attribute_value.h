#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <ddb/number_literal.h>
#include <ddb/value.h>

namespace ddb {

// The DynamoDB type descriptors. Code that branches on a Tag switches over
// all ten members without a default so that a missing case is a warning.
enum class Tag {
    String,     // S
    Number,     // N
    Bool,       // BOOL
    Null,       // NULL
    Map,        // M
    List,       // L
    StringSet,  // SS
    NumberSet,  // NS
    BinarySet,  // BS
    Binary      // B
};

// Wire spelling of a tag: "S", "N", "BOOL", ...
const char* tag_name(Tag tag);

// Exact, case-sensitive lookup of a wire spelling.
std::optional<Tag> tag_from_name(const std::string& name);

// One DynamoDB attribute value: a tag and the payload that tag calls for.
class AttributeValue {
  public:
    using Map = std::vector<std::pair<std::string, AttributeValue> >;
    using List = std::vector<AttributeValue>;

    static AttributeValue string(std::string s);
    static AttributeValue number(NumberLiteral n);
    static AttributeValue boolean(bool b);
    static AttributeValue null();
    static AttributeValue map(Map entries);
    static AttributeValue list(List elements);
    static AttributeValue stringSet(std::vector<std::string> strings);
    static AttributeValue numberSet(std::vector<NumberLiteral> numbers);
    static AttributeValue binarySet(std::vector<std::string> base64);
    static AttributeValue binary(std::string base64);

    Tag tag() const noexcept { return my_tag; }
    const char* tagName() const { return tag_name(my_tag); }

    // Accessors throw std::logic_error when called for the wrong tag.
    const std::string& asString() const;  // S
    const std::string& asBinary() const;  // B
    const NumberLiteral& asNumber() const;
    bool asBool() const;
    const Map& asMap() const;
    const List& asList() const;
    const std::vector<std::string>& asStrings() const;  // SS or BS
    const std::vector<NumberLiteral>& asNumbers() const;

    // Read the JSON form `{"<tag>": <payload>}`. Throws CodecError; `path`
    // prefixes the location reported in the error.
    static AttributeValue fromJson(const Value& json, const std::string& path = "");

    // The JSON form `{"<tag>": <payload>}`; NULL is written as `true`.
    Value toJson() const;

  private:
    using Payload = std::variant<std::string, NumberLiteral, bool, Map, List, std::vector<std::string>,
                                 std::vector<NumberLiteral> >;

    AttributeValue(Tag tag, Payload payload) : my_tag(tag), payload(std::move(payload)) {}

    template <typename T>
    const T& payloadAs(Tag expected) const;

    Tag my_tag;
    Payload payload;
};

}  // namespace ddb
