#include <catch2/catch_all.hpp>
#include <ddb/codec.h>
#include <ddb/json.h>

using namespace ddb;
using namespace ddb::json_literals;

TEST_CASE("Decode a simple item", "[codec][unmarshall]") {
    auto doc = R"({"name":{"S":"Alice"},"age":{"N":"30"},"tags":{"SS":["x","y"]}})"_json;
    auto plain = from_tagged(doc);
    REQUIRE(plain == R"({"name":"Alice","age":30,"tags":["x","y"]})"_json);
    REQUIRE(plain.at("age").isInt());
    REQUIRE(plain.dump() == R"({"name":"Alice","age":30,"tags":["x","y"]})");
}

TEST_CASE("Number literals decide integer or double", "[codec][unmarshall]") {
    REQUIRE(unmarshall_value(R"({"N": "4"})"_json).isInt());
    REQUIRE(unmarshall_value(R"({"N": "4.0"})"_json).isDouble());
    REQUIRE(unmarshall_value(R"({"N": "4e2"})"_json).asDouble() == 400.0);
    REQUIRE(unmarshall_value(R"({"N": "-17"})"_json).asInt() == -17);

    auto ns = unmarshall_value(R"({"NS": ["1", "2.5", "1E1"]})"_json);
    REQUIRE(ns.size() == 3);
    REQUIRE(ns.at(0).isInt());
    REQUIRE(ns.at(1).isDouble());
    REQUIRE(ns.at(2).isDouble());
}

TEST_CASE("Binary payloads stay base64 text", "[codec][unmarshall]") {
    REQUIRE(unmarshall_value(R"({"B": "AQID"})"_json) == Value("AQID"));
    REQUIRE(unmarshall_value(R"({"BS": ["AQI=", "AwQ="]})"_json) == Value::array({"AQI=", "AwQ="}));
}

TEST_CASE("NULL decodes to null whatever its payload", "[codec][unmarshall]") {
    REQUIRE(unmarshall_value(R"({"NULL": true})"_json).isNull());
    REQUIRE(unmarshall_value(R"({"NULL": false})"_json).isNull());
}

TEST_CASE("Nested maps and lists", "[codec][unmarshall]") {
    auto doc = R"({
        "profile": {"M": {
            "active": {"BOOL": true},
            "scores": {"L": [{"N": "1"}, {"N": "2.5"}, {"NULL": true}]},
            "address": {"M": {"city": {"S": "Oslo"}}}
        }}
    })"_json;
    auto plain = from_tagged(doc);
    REQUIRE(plain.dump() ==
            R"({"profile":{"active":true,"scores":[1,2.5,null],"address":{"city":"Oslo"}}})");
}

TEST_CASE("Attribute order is preserved", "[codec][unmarshall]") {
    auto plain = from_tagged(R"({"z":{"N":"1"},"a":{"N":"2"},"m":{"N":"3"}})"_json);
    REQUIRE(plain.keys() == std::vector<std::string>{"z", "a", "m"});
}

TEST_CASE("Item envelope is removed", "[codec][unmarshall][envelope]") {
    auto wrapped = from_tagged(R"({"Item": {"id": {"S": "k1"}}})"_json);
    auto bare = from_tagged(R"({"id": {"S": "k1"}})"_json);
    REQUIRE(wrapped == bare);
    REQUIRE(wrapped.dump() == R"({"id":"k1"})");
}

TEST_CASE("Empty containers", "[codec][unmarshall]") {
    REQUIRE(from_tagged(Value()).empty());
    REQUIRE(from_tagged(R"({"Item": {}})"_json).empty());
    REQUIRE(unmarshall_value(R"({"L": []})"_json) == Value::array());
    REQUIRE(unmarshall_value(R"({"M": {}})"_json) == Value());
    REQUIRE(unmarshall_value(R"({"SS": []})"_json) == Value::array());
}

TEST_CASE("A bare attribute value decodes on its own", "[codec][unmarshall]") {
    REQUIRE(unmarshall_value(R"({"S": "hello"})"_json) == Value("hello"));
    REQUIRE(unmarshall_value(R"({"L": [{"S": "a"}, {"BOOL": false}]})"_json) == Value::array({"a", false}));
}

TEST_CASE("Decoding from an AttributeValue", "[codec][unmarshall]") {
    AttributeValue::Map entries;
    entries.emplace_back("n", AttributeValue::number(*NumberLiteral::parse("0.25")));
    auto plain = unmarshall_value(AttributeValue::map(entries));
    REQUIRE(plain.at("n").asDouble() == 0.25);
}

TEST_CASE("A literal below the smallest double decodes to zero", "[codec][unmarshall]") {
    auto v = unmarshall_value(R"({"N": "1e-400"})"_json);
    REQUIRE(v.isDouble());
    REQUIRE(v.asDouble() == 0.0);
}
