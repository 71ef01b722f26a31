#include <catch2/catch.hpp>
#include "argtree/arity.hpp"

TEST_CASE("Arity - min greater than max is rejected", "[arity]") {
    REQUIRE_THROWS_AS(argtree::Arity(3, 2), argtree::ConfigError);
    REQUIRE_NOTHROW(argtree::Arity(2, 2));
}

TEST_CASE("Arity - isSatisfied is the closed interval", "[arity]") {
    const argtree::Arity a(1, 3);
    REQUIRE_FALSE(a.isSatisfied(0));
    REQUIRE(a.isSatisfied(1));
    REQUIRE(a.isSatisfied(3));
    REQUIRE_FALSE(a.isSatisfied(4));
}

TEST_CASE("Arity - named constants", "[arity]") {
    using argtree::Arity;
    REQUIRE(Arity::zero() == Arity(0, 0));
    REQUIRE(Arity::zeroOrOne() == Arity(0, 1));
    REQUIRE(Arity::exactlyOne() == Arity(1, 1));
    REQUIRE(Arity::zeroOrMore().min() == 0);
    REQUIRE(Arity::zeroOrMore().unbounded());
    REQUIRE(Arity::oneOrMore().min() == 1);
    REQUIRE(Arity::oneOrMore().isSatisfied(1000000));
    REQUIRE(Arity::many().min() == Arity::kUnbounded);
    REQUIRE_FALSE(Arity::many().isSatisfied(5));
}

TEST_CASE("Arity - str", "[arity]") {
    REQUIRE(argtree::Arity(1, 1).str() == "1");
    REQUIRE(argtree::Arity(0, 2).str() == "0..2");
    REQUIRE(argtree::Arity::oneOrMore().str() == "1..*");
}
