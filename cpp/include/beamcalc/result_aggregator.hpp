#pragma once

#include "beamcalc/beam_spec.hpp"
#include "beamcalc/cross_section.hpp"
#include "beamcalc/diagram_sampler.hpp"
#include "beamcalc/internal_actions.hpp"
#include "beamcalc/load_case_solver.hpp"

#include <string>
#include <vector>

namespace beamcalc {

/**
 * @brief Result of one beam analysis, in display units
 *
 * - max_moment [kN·m], signed: sagging positive (simply supported),
 *   hogging negative (cantilever fixed-end moment)
 * - max_shear [kN], magnitude
 * - max_stress [MPa], magnitude of the extreme fibre bending stress
 * - max_deflection [mm], largest |deflection| over the sampled points
 * - moment_of_inertia [m⁴]
 * - reactions: r1 [kN]; r2 [kN] (simply supported) or [kN·m] (cantilever)
 * - diagram: 101 points ascending in x from 0 to L
 */
struct BeamResult {
    SupportType support = SupportType::SimplySupported;
    LoadType load_type = LoadType::Point;

    double max_moment = 0.0;
    double max_shear = 0.0;
    double max_stress = 0.0;
    double max_deflection = 0.0;
    double moment_of_inertia = 0.0;
    double section_modulus = 0.0;   ///< W = I / c [m³]
    double area = 0.0;              ///< Cross-sectional area [m²] (0 for Custom)
    Reactions reactions;
    std::vector<DiagramPoint> diagram;

    /// Position [m] and value [kN·m] of the analytic peak moment
    ActionExtreme moment_extreme;

    /// Position [m] and signed value [mm] of the sampled peak deflection
    ActionExtreme deflection_extreme;

    /**
     * @brief Second moment of area in [cm⁴]
     */
    double moment_of_inertia_cm4() const;

    /**
     * @brief Short title, e.g. "Simply Supported Beam, Point Load"
     */
    std::string summary() const;

    /**
     * @brief Formatted key results, one per line, two decimals
     *
     * Max Moment: 250.00 kNm
     * Max Shear: 50.00 kN
     * Max Stress: 111.11 MPa
     * Max Deflection: 30.86 mm
     */
    std::string to_string() const;
};

/**
 * @brief Assembles the final BeamResult from the solver and sampled lines
 *
 * Peak moment and shear come from the solver's analytic expressions;
 * peak deflection is the largest magnitude over the sampled points.
 * Stress is σ = |M_max| · c / I. Conversion from SI to display units
 * happens here and nowhere earlier.
 */
class ResultAggregator {
public:
    static BeamResult aggregate(const LoadCaseSolver& solver,
                                const DiagramSeries& series,
                                const SectionProperties& section);
};

} // namespace beamcalc
