#include <catch2/catch_all.hpp>
#include <ddb/value.h>

using namespace ddb;

TEST_CASE("Objects keep keys in insertion order", "[value]") {
    Value v;
    v["zebra"] = 1;
    v["apple"] = 2;
    v["mango"] = 3;
    REQUIRE(v.keys() == std::vector<std::string>{"zebra", "apple", "mango"});
    REQUIRE(v.dump() == R"({"zebra":1,"apple":2,"mango":3})");
}

TEST_CASE("Overwriting a key keeps its first position", "[value]") {
    Value v;
    v["a"] = 1;
    v["b"] = 2;
    v["a"] = "again";
    REQUIRE(v.size() == 2);
    REQUIRE(v.keys().front() == "a");
    REQUIRE(v.at("a").asString() == "again");
}

TEST_CASE("Erase removes the key from the order too", "[value]") {
    Value v{{"a", 1}, {"b", 2}, {"c", 3}};
    v.erase("b");
    REQUIRE(v.keys() == std::vector<std::string>{"a", "c"});
    REQUIRE_FALSE(v.has("b"));
}

TEST_CASE("Object equality ignores key order", "[value]") {
    Value a{{"x", 1}, {"y", "two"}};
    Value b{{"y", "two"}, {"x", 1}};
    REQUIRE(a == b);
    b["x"] = 2;
    REQUIRE(a != b);
}

TEST_CASE("Integer and double are different kinds", "[value]") {
    REQUIRE(Value(4) != Value(4.0));
    REQUIRE(Value(4).isInt());
    REQUIRE(Value(4.0).isDouble());
    REQUIRE(Value(4).asDouble() == 4.0);
}

TEST_CASE("Scalar kinds and type strings", "[value]") {
    REQUIRE(Value::null().isNull());
    REQUIRE(Value::null().typeString() == "Null");
    REQUIRE(Value(true).isBool());
    REQUIRE(Value("s").isString());
    REQUIRE(Value(std::string("s")).typeString() == "String");
    REQUIRE(Value::array().isArrayObject());
    REQUIRE(Value().isMappedObject());
    REQUIRE(Value().empty());
}

TEST_CASE("Arrays are built with push_back", "[value]") {
    Value v = Value::array();
    v.push_back(1);
    v.push_back("two");
    v.push_back(Value::null());
    REQUIRE(v.size() == 3);
    REQUIRE(v.at(1).asString() == "two");
    REQUIRE(v.at(2).isNull());
    REQUIRE_THROWS_AS(v.at(3), std::out_of_range);
}

TEST_CASE("Missing keys give a helpful error", "[value]") {
    Value v{{"name", "Alice"}, {"age", 30}};
    try {
        v.at("nmae");
        FAIL("expected at() to throw");
    } catch (const std::out_of_range& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("nmae") != std::string::npos);
        REQUIRE(msg.find("\"name\",\"age\"") != std::string::npos);
    }
}

TEST_CASE("Accessors reject the wrong kind", "[value]") {
    Value v("text");
    REQUIRE_THROWS_AS(v.asBool(), std::runtime_error);
    REQUIRE_THROWS_AS(v.asInt(), std::runtime_error);
    REQUIRE_THROWS_AS(v.asArray(), std::runtime_error);
    REQUIRE_THROWS_AS(Value(1).asString(), std::runtime_error);
    REQUIRE_THROWS_AS(v.push_back(1), std::logic_error);
}

TEST_CASE("Compact dump", "[value][dump]") {
    Value v;
    v["s"] = "x";
    v["n"] = 30;
    v["f"] = 3.0;
    v["b"] = false;
    v["z"] = Value::null();
    v["l"] = Value::array({1, 2});
    v["m"] = Value();
    v["e"] = Value::array();
    REQUIRE(v.dump() == R"({"s":"x","n":30,"f":3.0,"b":false,"z":null,"l":[1,2],"m":{},"e":[]})");
}

TEST_CASE("Pretty dump indents nested containers", "[value][dump]") {
    Value v;
    v["name"] = "Alice";
    v["tags"] = Value::array({"x", "y"});
    v["empty"] = Value::array();
    v["inner"]["k"] = 1;
    std::string expected = R"({
  "name": "Alice",
  "tags": [
    "x",
    "y"
  ],
  "empty": [],
  "inner": {
    "k": 1
  }
})";
    REQUIRE(v.dump(2) == expected);
}

TEST_CASE("Dump escapes strings and keys", "[value][dump]") {
    Value v;
    v["quote\"key"] = std::string("line\nbreak\ttab\\ \x01");
    REQUIRE(v.dump() == "{\"quote\\\"key\":\"line\\nbreak\\ttab\\\\ \\u0001\"}");
}

TEST_CASE("Dump writes doubles so they read back as doubles", "[value][dump]") {
    REQUIRE(Value(1e200).dump() == "1e+200");
    REQUIRE(Value(0.1).dump() == "0.1");
    REQUIRE(Value(-2.0).dump() == "-2.0");
    REQUIRE(Value(int64_t(-9007199254740993)).dump() == "-9007199254740993");
}

TEST_CASE("Dump uses fixed notation for moderate doubles", "[value][dump]") {
    REQUIRE(Value(100000.0).dump() == "100000.0");
    REQUIRE(Value(0.0001).dump() == "0.0001");
    REQUIRE(Value(1e16).dump() == "1e+16");
}
