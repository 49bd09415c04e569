#pragma once

#include "beamcalc/errors.hpp"

#include <string>

namespace beamcalc {

/**
 * @brief Cross-section model used to describe the beam
 */
enum class SectionShape {
    Rectangular,  ///< Solid rectangle, width × height
    IBeam,        ///< Doubly symmetric I-section built from flanges and web
    Custom        ///< User-supplied I and extreme fibre distance
};

/**
 * @brief Cross-section input in display units
 *
 * A closed tagged union over the three section models. Only the fields
 * belonging to the active shape are meaningful:
 * - Rectangular: width, height [mm]
 * - IBeam: width (flange width), height, flange_thickness, web_thickness [mm]
 * - Custom: moment_of_inertia_cm4 [cm⁴], fibre_distance_mm [mm]
 *
 * Construct through the factory functions, which set the tag. A default
 * constructed section is an empty rectangle and fails validation.
 */
class CrossSection {
public:
    SectionShape shape;             ///< Active section model
    double width;                   ///< Section (flange) width [mm]
    double height;                  ///< Section height [mm]
    double flange_thickness;        ///< Flange thickness [mm] (IBeam only)
    double web_thickness;           ///< Web thickness [mm] (IBeam only)
    double moment_of_inertia_cm4;   ///< Second moment of area [cm⁴] (Custom only)
    double fibre_distance_mm;       ///< Neutral axis to extreme fibre [mm] (Custom only)

    /**
     * @brief Solid rectangular section
     * @param width Section width b [mm]
     * @param height Section height h [mm]
     */
    static CrossSection rectangular(double width, double height);

    /**
     * @brief Doubly symmetric I-section
     * @param width Flange width b [mm]
     * @param height Overall height h [mm]
     * @param flange_thickness Flange thickness tf [mm]
     * @param web_thickness Web thickness tw [mm]
     */
    static CrossSection i_beam(double width, double height,
                               double flange_thickness, double web_thickness);

    /**
     * @brief Section given directly by its properties
     * @param moment_of_inertia_cm4 Second moment of area [cm⁴]
     * @param fibre_distance_mm Distance to extreme fibre [mm]
     */
    static CrossSection custom(double moment_of_inertia_cm4, double fibre_distance_mm);

    /**
     * @brief Short description for reports, e.g. "rectangular (150x300mm)"
     */
    std::string describe() const;

    /**
     * @brief Empty rectangular section (all dimensions zero)
     */
    CrossSection();
};

/**
 * @brief Resolved section properties in SI units
 */
struct SectionProperties {
    double I = 0.0;  ///< Second moment of area about the bending axis [m⁴]
    double c = 0.0;  ///< Distance from neutral axis to extreme fibre [m]
    double A = 0.0;  ///< Cross-sectional area [m²] (0 for Custom sections)

    /**
     * @brief Elastic section modulus W = I / c [m³]
     */
    double section_modulus() const { return I / c; }

    /**
     * @brief Section depth used for span/depth checks [m]
     */
    double depth() const { return 2.0 * c; }
};

/**
 * @brief Derives I and c from a cross-section description
 *
 * Rectangular: I = b·h³/12, c = h/2
 * IBeam:       I = b·h³/12 − (b − tw)·(h − 2·tf)³/12, c = h/2
 * Custom:      I = I_cm4 / 1e8, c = c_mm / 1000
 *
 * Dimensions are converted from mm to m before any arithmetic.
 */
class CrossSectionResolver {
public:
    /**
     * @brief Check that the section describes a real, non-degenerate shape
     *
     * Rejects non-positive or non-finite dimensions, an I-section web at
     * least as wide as the flange, and flanges that together are at least
     * as thick as the section is high.
     *
     * @return BeamcalcError OK, or INVALID_GEOMETRY naming the first bad dimension
     */
    static BeamcalcError validate(const CrossSection& section);

    /**
     * @brief Compute the section properties
     *
     * @throws std::invalid_argument if validate() reports an error
     */
    static SectionProperties resolve(const CrossSection& section);

private:
    static SectionProperties resolve_rectangular(const CrossSection& section);
    static SectionProperties resolve_i_beam(const CrossSection& section);
    static SectionProperties resolve_custom(const CrossSection& section);
};

} // namespace beamcalc
