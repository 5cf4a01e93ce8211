#include <catch_main.hpp>

#include "libpolysimp/libpolysimp.h"
#include "libpolysimp/Exception.hpp"
#include "libpolysimp/Utils.hpp"

using namespace PolySimp;

namespace {

TEST_CASE("simplification_ratio_percent", "[utils]") {
    SECTION("Empty paths are clamped to a single point") {
        REQUIRE(simplification_ratio_percent(0, 0) == 100);
        REQUIRE(simplification_ratio_percent(1, 0) == 100);
    }
    SECTION("Ratio is rounded to whole percents") {
        REQUIRE(simplification_ratio_percent(10, 3) == 30);
        REQUIRE(simplification_ratio_percent(3, 2) == 67);
    }
}

TEST_CASE("float_to_string", "[utils]") {
    REQUIRE(float_to_string(0.) == "0");
    REQUIRE(float_to_string(0.1) == "0.1");
    REQUIRE(float_to_string(-12.5) == "-12.5");
    REQUIRE(float_to_string(1e20) == "1e+20");
}

TEST_CASE("Logging level", "[utils]") {
    SECTION("Levels above trace are clamped") {
        set_logging_level(9);
        REQUIRE(get_logging_level() == 5);
    }
    SECTION("Level parsed from a string") {
        REQUIRE(set_logging_level_from_string("3"));
        REQUIRE(get_logging_level() == 3);
    }
    SECTION("Malformed strings leave the level untouched") {
        set_logging_level(2);
        REQUIRE(! set_logging_level_from_string(""));
        REQUIRE(! set_logging_level_from_string("x"));
        REQUIRE(! set_logging_level_from_string("12"));
        REQUIRE(! set_logging_level_from_string(nullptr));
        REQUIRE(get_logging_level() == 2);
    }
    set_logging_level(1);
}

TEST_CASE("Exception hierarchy", "[utils]") {
    REQUIRE_THROWS_AS(throw OutOfRange("index"), LogicError);
    REQUIRE_THROWS_AS(throw InvalidArgument("argument"), CriticalException);
    REQUIRE_THROWS_AS(throw FileIOError("file"), RuntimeError);
    REQUIRE_THROWS_AS(throw FileIOError("file"), PolySimp::Exception);
    REQUIRE_THROWS_WITH(throw FileIOError("cannot open"), "cannot open");
}

}
