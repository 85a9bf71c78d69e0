#include "utils.hpp"
#include "errors.hpp"
#include "terminal.hpp"

#include <catch2/catch.hpp>

#include <sstream>

using namespace Rampart;

TEST_CASE("String helpers", "[utils]") {
    REQUIRE(trim("  foo \t\n") == "foo");
    REQUIRE(trim(" \n ").empty());
    REQUIRE(toLower("O") == "o");
    REQUIRE(toLower("MixedCase") == "mixedcase");
    REQUIRE(join({"a", "b", "c"}, ", ") == "a, b, c");
    REQUIRE(join({}, ", ").empty());
}

TEST_CASE("Version constraints are stripped from dependency strings", "[utils]") {
    REQUIRE(stripVersionConstraint("foo>=1.2") == "foo");
    REQUIRE(stripVersionConstraint("bar=3") == "bar");
    REQUIRE(stripVersionConstraint("baz<2") == "baz");
    REQUIRE(stripVersionConstraint("qux") == "qux");
    REQUIRE(stripVersionConstraint("libc++>=15") == "libc++");
}

TEST_CASE("Verbosity switch controls debug logging", "[utils]") {
    setVerbose(true);
    REQUIRE(isVerbose());
    setVerbose(false);
    REQUIRE_FALSE(isVerbose());
}

TEST_CASE("Operator answers are trimmed and lower-cased", "[utils][terminal]") {
    std::istringstream in("  O \nQ\n");
    StdinLineReader reader(in);

    REQUIRE(reader.readLine() == "o");
    REQUIRE(reader.readLine() == "q");
    REQUIRE_THROWS_AS(reader.readLine(), AuditAborted);
}
