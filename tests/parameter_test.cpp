#include <catch2/catch.hpp>
#include "argtree/parameter.hpp"

#include <string>
#include <vector>

using argtree::Argument;
using argtree::Arity;
using argtree::ConfigError;
using argtree::ErrorCode;
using argtree::Flag;
using argtree::Option;

TEST_CASE("Option - needs at least one name", "[parameter]") {
    REQUIRE_THROWS_AS(Option("", '\0', "nothing"), ConfigError);
    REQUIRE_NOTHROW(Option("", 'x', "short only"));
    REQUIRE_NOTHROW(Option("long", '\0', "long only"));
}

TEST_CASE("Option - key and display name", "[parameter]") {
    const Option both("--jobs", 'j', "jobs");
    REQUIRE(both.longName() == "jobs");
    REQUIRE(both.key() == "jobs");
    REQUIRE(both.displayName() == "--jobs");

    const Option shortOnly("", 'x', "x");
    REQUIRE(shortOnly.key() == "x");
    REQUIRE(shortOnly.displayName() == "-x");
}

TEST_CASE("Option - default arity is zero or one", "[parameter]") {
    REQUIRE(Option("name", 'n', "").arity() == Arity::zeroOrOne());
}

TEST_CASE("Option - typed default is encoded", "[parameter]") {
    auto o = Option::of<int>("count", 'c', "count").defaultValue(1);
    REQUIRE(o.typeName() == "int");
    REQUIRE(o.defaults() == std::vector<std::string>{"1"});
}

TEST_CASE("Parameter - setDefaults twice is rejected", "[parameter]") {
    Option o("name", 'n', "");
    o.setDefaults({"a"});
    REQUIRE_THROWS_AS(o.setDefaults({"b"}), ConfigError);
}

TEST_CASE("Parameter - defaults must satisfy arity", "[parameter]") {
    Option o("nums", '\0', "");
    o.arity(Arity(1, 2));
    REQUIRE_THROWS_AS(o.setDefaults({}), ConfigError);
    REQUIRE_THROWS_AS(o.setDefaults({"1", "2", "3"}), ConfigError);
    REQUIRE_NOTHROW(o.setDefaults({"1", "2"}));
}

TEST_CASE("Parameter - narrowing arity below existing defaults is rejected", "[parameter]") {
    auto o = Option::of<int>("nums", '\0', "").arity(Arity(0, 3)).defaultValues(std::vector<int>{1, 2, 3});
    REQUIRE_THROWS_AS(o.arity(Arity(0, 2)), ConfigError);
}

TEST_CASE("Parameter - rejected arity change leaves the arity unchanged", "[parameter]") {
    auto o = Option("nums", '\0', "").arity(Arity(0, 3));
    o.setDefaults({"1", "2", "3"});
    REQUIRE_THROWS_AS(o.arity(Arity(0, 2)), ConfigError);
    REQUIRE(o.arity() == Arity(0, 3));

    Option given("name", 'n', "");
    given.setValues({"a"});
    REQUIRE_THROWS_AS(given.arity(Arity(2, 2)), ConfigError);
    REQUIRE(given.arity() == Arity::zeroOrOne());
}

TEST_CASE("Parameter - setValues checks arity", "[parameter]") {
    Option o("name", 'n', "");
    REQUIRE_THROWS_AS(o.setValues({"a", "b"}), ConfigError);
    o.setValues({"a"});
    REQUIRE(o.values() == std::vector<std::string>{"a"});
}

TEST_CASE("Parameter - effectiveValues prefers values over defaults", "[parameter]") {
    Option o("name", 'n', "");
    o.setDefaults({"fallback"});
    REQUIRE(o.effectiveValues() == std::vector<std::string>{"fallback"});
    o.setValues({"given"});
    REQUIRE(o.effectiveValues() == std::vector<std::string>{"given"});
    o.clearValues();
    REQUIRE(o.effectiveValues() == std::vector<std::string>{"fallback"});
}

TEST_CASE("Parameter - effectiveValues without any value", "[parameter]") {
    const Option o("name", 'n', "");
    try {
        (void)o.effectiveValues();
        FAIL("expected an error");
    } catch (const argtree::Error& e) {
        REQUIRE(e.code() == ErrorCode::NoValueSet);
    }

    const Argument required("input", "", true);
    try {
        (void)required.effectiveValues();
        FAIL("expected an error");
    } catch (const argtree::Error& e) {
        REQUIRE(e.code() == ErrorCode::RequiredMissing);
    }
}

TEST_CASE("Argument - required forces exactly one", "[parameter]") {
    const Argument a("input", "", true);
    REQUIRE(a.arity() == Arity::exactlyOne());
    REQUIRE(Argument("extra", "", false).arity() == Arity::zeroOrOne());
}

TEST_CASE("Argument - required argument cannot accept zero values", "[parameter]") {
    Argument a("input", "", true);
    REQUIRE_THROWS_AS(a.arity(Arity::zeroOrMore()), ConfigError);
    REQUIRE_NOTHROW(a.arity(Arity(1, 3)));
}

TEST_CASE("Argument - must accept at least one value", "[parameter]") {
    Argument a("a", "", false);
    REQUIRE_THROWS_AS(a.arity(Arity::zero()), ConfigError);
    REQUIRE(a.arity() == Arity::zeroOrOne());
    REQUIRE_NOTHROW(a.arity(Arity::zeroOrMore()));
}

TEST_CASE("Argument - required argument cannot have a default", "[parameter]") {
    Argument a("input", "", true);
    REQUIRE_THROWS_AS(a.setDefaults({"x"}), ConfigError);
    Argument b("extra", "", false);
    REQUIRE_NOTHROW(b.defaultValue(std::string("x")));
}

TEST_CASE("Flag - key falls back to the short name", "[parameter]") {
    REQUIRE(Flag("verbose", 'v', "").key() == "verbose");
    REQUIRE(Flag("", 'n', "").key() == "n");
    REQUIRE_THROWS_AS(Flag("", '\0', ""), ConfigError);
}
