/**
 * @file test_units.cpp
 * @brief C++ tests for display unit <-> SI conversions
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "beamcalc/units.hpp"

#include <cmath>

using namespace beamcalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Force and stress conversions use the SI factors", "[Units][scalar]") {
    REQUIRE(units::kn_to_n(2.5) == 2500.0);
    REQUIRE(units::n_to_kn(2500.0) == 2.5);
    REQUIRE(units::gpa_to_pa(200.0) == 200e9);
    REQUIRE_THAT(units::pa_to_gpa(69e9), WithinRel(69.0, 1e-15));
    REQUIRE_THAT(units::pa_to_mpa(111.5e6), WithinRel(111.5, 1e-15));
}

TEST_CASE("Length and inertia conversions use the SI factors", "[Units][scalar]") {
    REQUIRE(units::mm_to_m(300.0) == 0.3);
    REQUIRE(units::m_to_mm(0.25) == 250.0);
    REQUIRE(units::cm4_to_m4(8000.0) == 8e-5);
    REQUIRE_THAT(units::m4_to_cm4(3.375e-4), WithinRel(337500.0, 1e-12));
}

TEST_CASE("Converting to SI and back recovers the value", "[Units][roundtrip]") {
    REQUIRE_THAT(units::m4_to_cm4(units::cm4_to_m4(8000.0)), WithinRel(8000.0, 1e-12));
    REQUIRE_THAT(units::n_to_kn(units::kn_to_n(37.3)), WithinRel(37.3, 1e-12));
    REQUIRE_THAT(units::m_to_mm(units::mm_to_m(7.4)), WithinRel(7.4, 1e-12));
    REQUIRE_THAT(units::pa_to_gpa(units::gpa_to_pa(30.0)), WithinRel(30.0, 1e-12));
}

TEST_CASE("round_to keeps two decimals", "[Units][rounding]") {
    REQUIRE_THAT(units::round_to(1.23456, 2), WithinAbs(1.23, 1e-12));
    REQUIRE_THAT(units::round_to(-41.6789, 2), WithinAbs(-41.68, 1e-12));
    REQUIRE_THAT(units::round_to(1250.0, 2), WithinAbs(1250.0, 1e-12));
    REQUIRE_THAT(units::round_to(3.14159, 0), WithinAbs(3.0, 1e-12));
}

TEST_CASE("round_to does not produce negative zero", "[Units][rounding]") {
    double rounded = units::round_to(-0.001, 2);
    REQUIRE(rounded == 0.0);
    REQUIRE_FALSE(std::signbit(rounded));
}
