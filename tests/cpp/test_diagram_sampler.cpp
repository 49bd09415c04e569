/**
 * @file test_diagram_sampler.cpp
 * @brief C++ tests for the 101-point diagram discretization
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "beamcalc/diagram_sampler.hpp"
#include "beamcalc/load_case_solver.hpp"

#include <cmath>
#include <vector>

using namespace beamcalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

const double E = 200e9;     // [Pa]
const double I = 3.375e-4;  // [m^4]

bool has_two_decimals(double value) {
    double scaled = value * 100.0;
    return std::abs(scaled - std::round(scaled)) < 1e-6;
}

} // namespace

// =============================================================================
// Positions
// =============================================================================

TEST_CASE("Sampler produces 101 ascending positions from 0 to L", "[DiagramSampler][positions]") {
    std::vector<double> spans = {10.0, 0.3, 7.77, 123.456};

    for (double L : spans) {
        INFO("L = " << L);
        LoadCaseSolver solver(BeamCase::SIMPLY_SUPPORTED_UDL, L, 10e3, 0.0, E, I);
        std::vector<DiagramPoint> points = DiagramSampler::sample(solver);

        REQUIRE(points.size() == 101);
        REQUIRE(points.front().x == 0.0);
        REQUIRE(points.back().x == L);
        for (size_t i = 1; i < points.size(); ++i) {
            REQUIRE(points[i].x > points[i - 1].x);
        }
        REQUIRE_THAT(points[50].x, WithinRel(L / 2.0, 1e-12));
    }
}

TEST_CASE("Series vectors all have NUM_INTERVALS + 1 entries", "[DiagramSampler][series]") {
    LoadCaseSolver solver(BeamCase::CANTILEVER_UDL, 4.0, 10e3, 0.0, E, I);
    DiagramSeries series = DiagramSampler::sample_series(solver);

    REQUIRE(series.size() == DiagramSampler::NUM_INTERVALS + 1);
    REQUIRE(series.moment.size() == series.size());
    REQUIRE(series.shear.size() == series.size());
    REQUIRE(series.deflection.size() == series.size());
    REQUIRE(series.x(series.size() - 1) == 4.0);
}

// =============================================================================
// Display conversion
// =============================================================================

TEST_CASE("Moment and shear are reported in kN with two decimals", "[DiagramSampler][units]") {
    LoadCaseSolver solver(BeamCase::SIMPLY_SUPPORTED_POINT, 7.77, 33.333e3, 2.2, E, I);
    DiagramSeries series = DiagramSampler::sample_series(solver);
    std::vector<DiagramPoint> points = DiagramSampler::to_points(series);

    for (size_t i = 0; i < points.size(); ++i) {
        INFO("point " << i);
        REQUIRE(has_two_decimals(points[i].moment));
        REQUIRE(has_two_decimals(points[i].shear));
        REQUIRE_THAT(points[i].moment, WithinAbs(series.moment(i) / 1000.0, 0.005 + 1e-9));
        REQUIRE_THAT(points[i].shear, WithinAbs(series.shear(i) / 1000.0, 0.005 + 1e-9));
        // Deflection is converted to mm but not rounded
        REQUIRE_THAT(points[i].deflection, WithinRel(series.deflection(i) * 1000.0, 1e-12));
    }
}

TEST_CASE("Simply supported point load diagram around the load", "[DiagramSampler][scenario]") {
    // L = 10 m, P = 100 kN at midspan
    LoadCaseSolver solver(BeamCase::SIMPLY_SUPPORTED_POINT, 10.0, 100e3, 5.0, E, I);
    std::vector<DiagramPoint> points = DiagramSampler::sample(solver);

    REQUIRE_THAT(points[50].moment, WithinAbs(250.0, 1e-9));
    REQUIRE_THAT(points[49].shear, WithinAbs(50.0, 1e-9));
    REQUIRE_THAT(points[51].shear, WithinAbs(-50.0, 1e-9));
    REQUIRE_THAT(points[0].moment, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(points[100].moment, WithinAbs(0.0, 1e-9));

    // Midspan deflection PL^3/48EI in mm
    double expected_mm = 100e3 * 1000.0 / (48.0 * E * I) * 1000.0;
    REQUIRE_THAT(points[50].deflection, WithinRel(expected_mm, 1e-9));
}

TEST_CASE("Simply supported UDL diagram peaks at midspan", "[DiagramSampler][scenario]") {
    // L = 10 m, w = 100 kN/m
    LoadCaseSolver solver(BeamCase::SIMPLY_SUPPORTED_UDL, 10.0, 100e3, 0.0, E, I);
    std::vector<DiagramPoint> points = DiagramSampler::sample(solver);

    REQUIRE_THAT(points[50].moment, WithinAbs(1250.0, 1e-9));
    REQUIRE_THAT(points[0].shear, WithinAbs(500.0, 1e-9));
    REQUIRE_THAT(points[100].shear, WithinAbs(-500.0, 1e-9));

    for (const auto& p : points) {
        REQUIRE(p.moment <= points[50].moment);
        REQUIRE(p.deflection <= points[50].deflection + 1e-12);
    }
}

TEST_CASE("Sampling the same solver twice is bit-identical", "[DiagramSampler][determinism]") {
    LoadCaseSolver solver(BeamCase::CANTILEVER_POINT, 6.3, 12.5e3, 4.1, E, I);

    std::vector<DiagramPoint> first = DiagramSampler::sample(solver);
    std::vector<DiagramPoint> second = DiagramSampler::sample(solver);

    REQUIRE(first.size() == second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        REQUIRE(first[i].x == second[i].x);
        REQUIRE(first[i].moment == second[i].moment);
        REQUIRE(first[i].shear == second[i].shear);
        REQUIRE(first[i].deflection == second[i].deflection);
    }
}
