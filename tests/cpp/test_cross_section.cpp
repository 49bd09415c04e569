/**
 * @file test_cross_section.cpp
 * @brief C++ tests for section property resolution, the standard section
 *        catalogue and material presets
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "beamcalc/cross_section.hpp"
#include "beamcalc/material.hpp"
#include "beamcalc/section_catalog.hpp"

#include <stdexcept>

using namespace beamcalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using Catch::Matchers::ContainsSubstring;

// =============================================================================
// Rectangular
// =============================================================================

TEST_CASE("Rectangular 150x300 section properties", "[CrossSection][rectangular]") {
    SectionProperties props = CrossSectionResolver::resolve(CrossSection::rectangular(150.0, 300.0));

    // I = 0.15 * 0.3^3 / 12
    REQUIRE_THAT(props.I, WithinRel(3.375e-4, 1e-12));
    REQUIRE_THAT(props.c, WithinRel(0.15, 1e-12));
    REQUIRE_THAT(props.A, WithinRel(0.045, 1e-12));
    REQUIRE_THAT(props.section_modulus(), WithinRel(2.25e-3, 1e-12));
}

TEST_CASE("Rectangular section rejects non-positive dimensions", "[CrossSection][rectangular][validation]") {
    BeamcalcError err = CrossSectionResolver::validate(CrossSection::rectangular(0.0, 300.0));
    REQUIRE(err.code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(err.involved_parameters.front() == "width");

    err = CrossSectionResolver::validate(CrossSection::rectangular(150.0, -1.0));
    REQUIRE(err.code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(err.involved_parameters.front() == "height");

    REQUIRE(CrossSectionResolver::validate(CrossSection()).is_error());
}

// =============================================================================
// I-beam
// =============================================================================

TEST_CASE("I-beam inertia is gross rectangle minus the voids", "[CrossSection][ibeam]") {
    // IPE 160 dimensions without root fillets
    double b = 0.082, h = 0.160, tf = 0.0074, tw = 0.005;
    double expected = b * h * h * h / 12.0
                    - (b - tw) * (h - 2 * tf) * (h - 2 * tf) * (h - 2 * tf) / 12.0;

    SectionProperties props = CrossSectionResolver::resolve(
        CrossSection::i_beam(82.0, 160.0, 7.4, 5.0));

    REQUIRE_THAT(props.I, WithinRel(expected, 1e-9));
    REQUIRE_THAT(props.c, WithinRel(0.08, 1e-12));
    REQUIRE_THAT(props.A, WithinRel(b * h - (b - tw) * (h - 2 * tf), 1e-9));

    // Roughly 835 cm4 (tabulated IPE 160 with fillets: 869 cm4)
    REQUIRE(props.I * 1e8 > 800.0);
    REQUIRE(props.I * 1e8 < 900.0);
}

TEST_CASE("I-beam with web as wide as the flange is rejected", "[CrossSection][ibeam][validation]") {
    BeamcalcError err = CrossSectionResolver::validate(CrossSection::i_beam(100.0, 200.0, 10.0, 100.0));
    REQUIRE(err.code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(err.involved_parameters.front() == "web_thickness");

    err = CrossSectionResolver::validate(CrossSection::i_beam(100.0, 200.0, 10.0, 120.0));
    REQUIRE(err.code == ErrorCode::INVALID_GEOMETRY);
}

TEST_CASE("I-beam with flanges filling the height is rejected", "[CrossSection][ibeam][validation]") {
    BeamcalcError err = CrossSectionResolver::validate(CrossSection::i_beam(100.0, 200.0, 100.0, 8.0));
    REQUIRE(err.code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(err.involved_parameters.front() == "flange_thickness");
    REQUIRE_THAT(err.to_string(), ContainsSubstring("INVALID_GEOMETRY"));
}

TEST_CASE("I-beam rejects zero thicknesses", "[CrossSection][ibeam][validation]") {
    REQUIRE(CrossSectionResolver::validate(CrossSection::i_beam(100.0, 200.0, 0.0, 8.0)).is_error());
    REQUIRE(CrossSectionResolver::validate(CrossSection::i_beam(100.0, 200.0, 10.0, 0.0)).is_error());
    REQUIRE(CrossSectionResolver::validate(CrossSection::i_beam(100.0, 200.0, 10.0, 8.0)).is_ok());
}

// =============================================================================
// Custom
// =============================================================================

TEST_CASE("Custom section converts cm4 and mm to SI", "[CrossSection][custom]") {
    SectionProperties props = CrossSectionResolver::resolve(CrossSection::custom(8000.0, 150.0));

    REQUIRE_THAT(props.I, WithinRel(8e-5, 1e-12));
    REQUIRE_THAT(props.c, WithinRel(0.15, 1e-12));
    REQUIRE(props.A == 0.0);
}

TEST_CASE("Custom section rejects non-positive properties", "[CrossSection][custom][validation]") {
    BeamcalcError err = CrossSectionResolver::validate(CrossSection::custom(0.0, 150.0));
    REQUIRE(err.code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(err.involved_parameters.front() == "moment_of_inertia");

    err = CrossSectionResolver::validate(CrossSection::custom(8000.0, -3.0));
    REQUIRE(err.code == ErrorCode::INVALID_GEOMETRY);
    REQUIRE(err.involved_parameters.front() == "fibre_distance");
}

TEST_CASE("resolve throws on invalid geometry", "[CrossSection][validation]") {
    REQUIRE_THROWS_AS(CrossSectionResolver::resolve(CrossSection::i_beam(50.0, 100.0, 60.0, 5.0)),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(CrossSectionResolver::resolve(CrossSection::custom(-1.0, 10.0)),
                      std::invalid_argument);
}

TEST_CASE("describe names the shape and dimensions", "[CrossSection][describe]") {
    REQUIRE(CrossSection::rectangular(150.0, 300.0).describe() == "rectangular (150x300mm)");
    REQUIRE_THAT(CrossSection::i_beam(82.0, 160.0, 7.4, 5.0).describe(), ContainsSubstring("i-beam"));
    REQUIRE_THAT(CrossSection::custom(8000.0, 150.0).describe(), ContainsSubstring("8000 cm4"));
}

// =============================================================================
// Catalogue and presets
// =============================================================================

TEST_CASE("Standard IPE sections are found by name", "[SectionCatalog]") {
    auto ipe120 = find_standard_section("IPE 120");
    REQUIRE(ipe120.has_value());
    REQUIRE(ipe120->shape == SectionShape::IBeam);
    REQUIRE(ipe120->height == 120.0);
    REQUIRE(ipe120->width == 64.0);
    REQUIRE(ipe120->web_thickness == 4.4);
    REQUIRE(ipe120->flange_thickness == 6.3);

    auto rect = find_standard_section("200 x 400 mm");
    REQUIRE(rect.has_value());
    REQUIRE(rect->shape == SectionShape::Rectangular);
    REQUIRE(rect->width == 200.0);
    REQUIRE(rect->height == 400.0);

    REQUIRE_FALSE(find_standard_section("HEB 200").has_value());
}

TEST_CASE("Every catalogue section has valid geometry", "[SectionCatalog][validation]") {
    auto ipe = standard_sections(SectionShape::IBeam);
    auto rect = standard_sections(SectionShape::Rectangular);
    REQUIRE(ipe.size() == 5);
    REQUIRE(rect.size() == 4);
    REQUIRE(standard_sections(SectionShape::Custom).empty());

    for (const auto& entry : ipe) {
        INFO(entry.name);
        REQUIRE(CrossSectionResolver::validate(entry.section).is_ok());
    }
    for (const auto& entry : rect) {
        INFO(entry.name);
        REQUIRE(CrossSectionResolver::validate(entry.section).is_ok());
    }
}

TEST_CASE("Material presets carry the elastic modulus", "[Material]") {
    auto steel = Material::find_preset("Steel");
    REQUIRE(steel.has_value());
    REQUIRE(steel->E_gpa == 200.0);
    REQUIRE(steel->E_pa() == 200e9);

    REQUIRE(Material::find_preset("Aluminum")->E_gpa == 69.0);
    REQUIRE(Material::find_preset("Concrete")->E_gpa == 30.0);
    REQUIRE_FALSE(Material::find_preset("Timber").has_value());
    REQUIRE(Material::presets().size() == 3);
}
