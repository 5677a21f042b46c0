/*
===============================================================================
TEST NAMING — Tests for naming.h
===============================================================================

Covers the two naming styles used by the cost model and the debug/release
behaviour of make_name::.

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• naming.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include <laundry/naming.h>

using namespace laundry;

TEST_CASE("A1: ForceName::IndexStyle", "[naming][force]")
{
    REQUIRE(force_name::index("x_misto", "20") == "x_misto_20");
    REQUIRE(force_name::index("a_camisa") == "a_camisa");
    REQUIRE(force_name::index("v", { "1", "2" }) == "v_1_2");
}

TEST_CASE("A2: ForceName::MathStyle", "[naming][force]")
{
    REQUIRE(force_name::math("limite_camisas", "40") == "limite_camisas[40]");
    REQUIRE(force_name::math("cobertura_pecas") == "cobertura_pecas");
    REQUIRE(force_name::math("c", { "1", "2" }) == "c[1,2]");
}

TEST_CASE("A3: ForceName::EmptyBaseWithParts", "[naming][force][error]")
{
    REQUIRE_THROWS_AS(force_name::index("", "20"), std::invalid_argument);
    REQUIRE_THROWS_AS(force_name::math("", "20"), std::invalid_argument);
    REQUIRE(force_name::index("").empty());
}

TEST_CASE("B1: MakeName::FollowsBuildMode", "[naming][make]")
{
    if constexpr (naming_enabled()) {
        REQUIRE(make_name::index("y_cam", "10") == "y_cam_10");
        REQUIRE(make_name::math("limite_camisas", "20") == "limite_camisas[20]");
    }
    else {
        REQUIRE(make_name::index("y_cam", "10").empty());
        REQUIRE(make_name::math("limite_camisas", "20").empty());
    }
}
