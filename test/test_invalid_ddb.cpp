#include <catch2/catch_all.hpp>
#include <ddb/codec.h>
#include <ddb/json.h>

using namespace ddb;

namespace {
    CodecError decode_error(const std::string& text) {
        try {
            from_tagged(parse_json(text));
        } catch (const CodecError& e) {
            return e;
        }
        FAIL("expected from_tagged to throw for " << text);
        return CodecError(ErrorKind::MalformedTagObject, "", "");
    }
}

TEST_CASE("Unknown type descriptor", "[codec][errors]") {
    auto e = decode_error(R"({"a": {"X": "y"}})");
    REQUIRE(e.kind() == ErrorKind::UnknownTag);
    REQUIRE(e.path() == "a");
    REQUIRE(std::string(e.what()) == "a: unknown type descriptor 'X'");

    REQUIRE(decode_error(R"({"a": {"s": "lowercase"}})").kind() == ErrorKind::UnknownTag);
}

TEST_CASE("Tag objects need exactly one key", "[codec][errors]") {
    auto two = decode_error(R"({"a": {"S": "a", "N": "1"}})");
    REQUIRE(two.kind() == ErrorKind::MalformedTagObject);
    REQUIRE(two.detail() == "DynamoDB type object must have exactly one key, found 2 (S, N)");

    auto none = decode_error(R"({"a": {}})");
    REQUIRE(none.kind() == ErrorKind::MalformedTagObject);
    REQUIRE(none.detail() == "DynamoDB type object must have exactly one key, found 0");
}

TEST_CASE("Attributes must be objects", "[codec][errors]") {
    auto e = decode_error(R"({"name": "Alice"})");
    REQUIRE(e.kind() == ErrorKind::MalformedTagObject);
    REQUIRE(e.path() == "name");
    REQUIRE(e.detail() == R"(expected a DynamoDB type object such as {"S": ...}, got string)");
}

TEST_CASE("Bad number literals", "[codec][errors]") {
    auto e = decode_error(R"({"n": {"N": "abc"}})");
    REQUIRE(e.kind() == ErrorKind::InvalidNumberLiteral);
    REQUIRE(e.detail() == "invalid number literal 'abc'");

    for (auto const* text : {R"({"n": {"N": ""}})", R"({"n": {"N": " 1"}})", R"({"n": {"N": "NaN"}})",
                             R"({"n": {"N": "Infinity"}})", R"({"n": {"N": "0x1F"}})"}) {
        INFO(text);
        REQUIRE(decode_error(text).kind() == ErrorKind::InvalidNumberLiteral);
    }
}

TEST_CASE("Numbers too large for the target type", "[codec][errors]") {
    auto wide = decode_error(R"({"n": {"N": "123456789012345678901234567890"}})");
    REQUIRE(wide.kind() == ErrorKind::InvalidNumberLiteral);
    REQUIRE(wide.detail().find("does not fit in 64 bits") != std::string::npos);

    auto huge = decode_error(R"({"n": {"N": "1e999"}})");
    REQUIRE(huge.kind() == ErrorKind::InvalidNumberLiteral);
}

TEST_CASE("Payload shapes must fit the tag", "[codec][errors]") {
    struct Case {
        const char* text;
        const char* detail;
    };
    Case cases[] = {
        {R"({"a": {"S": 5}})", "S expects a string, got number"},
        {R"({"a": {"N": 5}})", "N expects a number literal in a string, got number"},
        {R"({"a": {"BOOL": "true"}})", "BOOL expects a boolean, got string"},
        {R"({"a": {"M": []}})", "M expects an object, got array"},
        {R"({"a": {"L": {}}})", "L expects an array, got object"},
        {R"({"a": {"SS": "x"}})", "SS expects an array of strings, got string"},
        {R"({"a": {"NS": "1"}})", "NS expects an array of number literals, got string"},
        {R"({"a": {"B": null}})", "B expects a base64 string, got null"},
        {R"({"a": {"BS": [true]}})", "BS elements must be strings, got boolean"},
    };
    for (auto const& c : cases) {
        INFO(c.text);
        auto e = decode_error(c.text);
        REQUIRE(e.kind() == ErrorKind::TypeMismatch);
        REQUIRE(e.detail() == c.detail);
    }
}

TEST_CASE("Errors point at the nested field", "[codec][errors]") {
    auto e = decode_error(R"({"profile": {"M": {"orders": {"L": [{"N": "1"}, {"N": "x"}]}}}})");
    REQUIRE(e.path() == "profile.orders[1]");
    REQUIRE(std::string(e.what()) == "profile.orders[1]: invalid number literal 'x'");

    auto ns = decode_error(R"({"tags": {"NS": ["1", "2", "three"]}})");
    REQUIRE(ns.path() == "tags[2]");
}

TEST_CASE("An invalid nested field fails the whole item", "[codec][errors]") {
    REQUIRE_THROWS_AS(from_tagged(parse_json(R"({"ok": {"S": "fine"}, "bad": {"Q": 1}})")), CodecError);
}

TEST_CASE("The item itself must be an object", "[codec][errors]") {
    auto e = decode_error(R"([{"S": "x"}])");
    REQUIRE(e.kind() == ErrorKind::TypeMismatch);
    REQUIRE(e.path().empty());

    REQUIRE(decode_error(R"("text")").kind() == ErrorKind::TypeMismatch);
}

TEST_CASE("A bare value that is not a tag object", "[codec][errors]") {
    try {
        unmarshall_value(parse_json("42"));
        FAIL("expected unmarshall_value to throw");
    } catch (const CodecError& e) {
        REQUIRE(e.kind() == ErrorKind::MalformedTagObject);
        REQUIRE(e.path().empty());
    }
}
