#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <unlock/core/geo.hpp>

using namespace unlock::core;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Haversine distance", "[core][geo]") {
    Coordinate giza{29.9792, 31.1342};
    Coordinate karnak{25.7188, 32.6573};

    SECTION("Distance to self is zero") {
        REQUIRE_THAT(distance_meters(giza, giza), WithinAbs(0.0, 1e-6));
    }

    SECTION("Symmetric") {
        REQUIRE_THAT(distance_meters(giza, karnak), WithinAbs(distance_meters(karnak, giza), 1e-6));
    }

    SECTION("One degree of latitude is about 111 km") {
        Coordinate a{0.0, 0.0};
        Coordinate b{1.0, 0.0};
        REQUIRE_THAT(distance_km(a, b), WithinRel(111.195, 0.001));
    }

    SECTION("Giza to Karnak") {
        REQUIRE_THAT(distance_km(giza, karnak), WithinRel(497.0, 0.02));
    }
}

TEST_CASE("offset_by moves the requested distance", "[core][geo]") {
    Coordinate origin{29.9792, 31.1342};

    for (double bearing : {0.0, 90.0, 180.0, 270.0, 45.0}) {
        auto moved = offset_by(origin, 150.0, bearing);
        REQUIRE_THAT(distance_meters(origin, moved), WithinAbs(150.0, 0.01));
    }

    auto north = offset_by(origin, 1000.0, 0.0);
    REQUIRE(north.latitude > origin.latitude);
    REQUIRE_THAT(north.longitude, WithinAbs(origin.longitude, 1e-9));
}

TEST_CASE("Coordinate validity", "[core][geo]") {
    REQUIRE(Coordinate{0.0, 0.0}.is_valid());
    REQUIRE(Coordinate{-90.0, 180.0}.is_valid());
    REQUIRE_FALSE(Coordinate{90.5, 0.0}.is_valid());
    REQUIRE_FALSE(Coordinate{0.0, -181.0}.is_valid());
}
