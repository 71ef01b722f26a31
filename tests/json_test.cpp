#include <catch2/catch.hpp>
#include "argtree/json.hpp"
#include "argtree/error.hpp"

#include <string>

using argtree::json::Value;

TEST_CASE("json::parse - nested document", "[json]") {
    const auto doc = argtree::json::parse(R"( {"name": "John", "id": 123, "tags": ["a", "b"], "ok": true, "x": null} )");
    REQUIRE(doc.isObject());
    REQUIRE(doc.size() == 5);
    REQUIRE(doc.at("name").asString() == "John");
    REQUIRE(doc.at("id").isNumber());
    REQUIRE(doc.at("id").scalarText() == "123");
    REQUIRE(doc.at("tags").size() == 2);
    REQUIRE(doc.at("tags").items()[1].asString() == "b");
    REQUIRE(doc.at("ok").asBool());
    REQUIRE(doc.at("x").isNull());
    REQUIRE(doc.find("missing") == nullptr);
}

TEST_CASE("json::parse - string escapes", "[json]") {
    const auto doc = argtree::json::parse(R"("a\"b\\c\n\u00e9")");
    REQUIRE(doc.asString() == "a\"b\\c\n\xc3\xa9");
}

TEST_CASE("json::parse - surrogate pairs decode to one code point", "[json]") {
    REQUIRE(argtree::json::parse(R"("\ud83d\ude00")").asString() == "\xf0\x9f\x98\x80");
    REQUIRE(argtree::json::parse(R"("a\uD834\uDD1Eb")").asString() == "a\xf0\x9d\x84\x9e" "b");
    for (const char* bad : {R"("\ud83d")", R"("\ude00")", R"("\ud83dx")", R"("\ud83d\u0041")"}) {
        INFO(bad);
        REQUIRE_THROWS_AS(argtree::json::parse(bad), argtree::Error);
    }
}

TEST_CASE("json::parse - deep nesting is rejected", "[json]") {
    for (const char open : {'[', '{'}) {
        std::string deep;
        for (int i = 0; i < 100000; ++i) {
            deep.push_back(open);
            if (open == '{') deep += R"("k":)";
        }
        try {
            (void)argtree::json::parse(deep);
            FAIL("expected a parse error");
        } catch (const argtree::Error& e) {
            REQUIRE(e.code() == argtree::ErrorCode::InvalidJsonFormat);
        }
    }
    const std::string ok = std::string(100, '[') + std::string(100, ']');
    REQUIRE(argtree::json::parse(ok).isArray());
}

TEST_CASE("json::parse - malformed input", "[json]") {
    for (const char* bad : {"", "{", "[1,]", "{\"a\" 1}", "tru", "1 2", "\"open", "-", "1."}) {
        INFO(bad);
        try {
            (void)argtree::json::parse(bad);
            FAIL("expected a parse error");
        } catch (const argtree::Error& e) {
            REQUIRE(e.code() == argtree::ErrorCode::InvalidJsonFormat);
        }
    }
}

TEST_CASE("json::Value::at - missing field names the key", "[json]") {
    const auto doc = argtree::json::parse(R"({"a": 1})");
    try {
        (void)doc.at("b");
        FAIL("expected an error");
    } catch (const argtree::Error& e) {
        REQUIRE(e.code() == argtree::ErrorCode::MissingField);
        REQUIRE(e.name() == "b");
    }
}

TEST_CASE("json::dump - compact output", "[json]") {
    auto obj = Value::object();
    obj.set("s", Value::string("tab\there"));
    obj.set("n", Value::number("-1.5e3"));
    auto arr = Value::array();
    arr.push(Value::boolean(false)).push(Value{});
    obj.set("a", std::move(arr));
    REQUIRE(argtree::json::dump(obj) == R"({"s":"tab\there","n":-1.5e3,"a":[false,null]})");

    obj.set("s", Value::string("replaced"));
    REQUIRE(obj.size() == 3);
    REQUIRE(obj.at("s").asString() == "replaced");
}

TEST_CASE("json::Value - kind mismatch", "[json]") {
    const auto v = Value::number("1");
    REQUIRE_THROWS_AS(v.asString(), argtree::Error);
    REQUIRE_THROWS_AS(v.asBool(), argtree::Error);
}
