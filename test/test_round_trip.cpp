#include <catch2/catch_all.hpp>
#include <ddb/codec.h>
#include <ddb/json.h>

using namespace ddb;
using namespace ddb::json_literals;

TEST_CASE("Plain items survive encode then decode", "[codec][round_trip]") {
    auto plain = R"({
        "id": "u-1",
        "age": 42,
        "balance": -10.25,
        "ratio": 2.0,
        "active": true,
        "nickname": null,
        "tags": ["a", "b", "a"],
        "history": [{"at": 1, "ok": false}, [], {}],
        "nested": {"deep": {"deeper": [1.5, "x", null]}}
    })"_json;
    for (bool wrap : {false, true}) {
        auto decoded = from_tagged(to_tagged(plain, wrap));
        REQUIRE(decoded == plain);
        REQUIRE(decoded.dump() == plain.dump());
    }
}

TEST_CASE("Tagged items without sets survive decode then encode", "[codec][round_trip]") {
    auto tagged = R"({"name":{"S":"Alice"},"age":{"N":"30"},"score":{"N":"9.5"},)"
                  R"("misc":{"L":[{"BOOL":true},{"NULL":true},{"M":{"k":{"S":"v"}}}]}})"_json;
    REQUIRE(to_tagged(from_tagged(tagged), false) == tagged);
}

TEST_CASE("Sets come back as lists", "[codec][round_trip]") {
    auto tagged = R"({"tags":{"SS":["x","y"]},"nums":{"NS":["1","2"]},"blobs":{"BS":["AQI="]}})"_json;
    auto again = to_tagged(from_tagged(tagged), false);
    REQUIRE(again.dump() == R"({"tags":{"L":[{"S":"x"},{"S":"y"}]},)"
                            R"("nums":{"L":[{"N":"1"},{"N":"2"}]},"blobs":{"L":[{"S":"AQI="}]}})");
    REQUIRE(from_tagged(again) == from_tagged(tagged));
}

TEST_CASE("Binary comes back as a string", "[codec][round_trip]") {
    auto again = to_tagged(from_tagged(R"({"blob":{"B":"AQID"}})"_json), false);
    REQUIRE(again.dump() == R"({"blob":{"S":"AQID"}})");
}

TEST_CASE("Number literal spelling is normalised", "[codec][round_trip]") {
    auto again = to_tagged(from_tagged(R"({"a":{"N":"+007"},"b":{"N":"1.50"},"c":{"N":"1e2"}})"_json), false);
    REQUIRE(again.dump() == R"({"a":{"N":"7"},"b":{"N":"1.5"},"c":{"N":"100.0"}})");
}

TEST_CASE("Envelope makes no difference to the decoded item", "[codec][round_trip][envelope]") {
    auto plain = R"({"k":"v","n":1})"_json;
    REQUIRE(from_tagged(to_tagged(plain, true)) == from_tagged(to_tagged(plain, false)));
}

TEST_CASE("Decoding is deterministic", "[codec][round_trip]") {
    auto tagged = R"({"a":{"M":{"x":{"N":"1"},"y":{"SS":["p","q"]}}}})"_json;
    REQUIRE(from_tagged(tagged).dump() == from_tagged(tagged).dump());
}
