#pragma once

#include "beamcalc/beam_spec.hpp"
#include "beamcalc/internal_actions.hpp"

namespace beamcalc {

/**
 * @brief Support × load combination
 *
 * Each case has its own closed-form reactions and x-functions.
 */
enum class BeamCase {
    SIMPLY_SUPPORTED_POINT = 0,  ///< Pin-roller, concentrated load P at x = a
    SIMPLY_SUPPORTED_UDL = 1,    ///< Pin-roller, uniform load w over L
    CANTILEVER_POINT = 2,        ///< Fixed at x = 0, concentrated load P at x = a
    CANTILEVER_UDL = 3           ///< Fixed at x = 0, uniform load w over L
};

/**
 * @brief Select the beam case for a support condition and load pattern
 */
BeamCase classify_beam_case(SupportType support, LoadType load_type);

/**
 * @brief Closed-form statics and elastic deflection of a single-span beam
 *
 * Euler-Bernoulli beam theory, small deflections, prismatic section.
 * Reactions are computed once on construction; moment, shear and
 * deflection are pure functions of the position x ∈ [0, L].
 *
 * Sign conventions:
 * - Moment: positive = sagging (tension at the bottom fibre)
 * - Shear: positive = upward force on the left part of the beam
 * - Deflection: positive in the direction of the applied load
 *
 * All quantities are in SI units: N, N/m, m, Pa, m⁴.
 *
 * Usage:
 *   LoadCaseSolver solver(BeamCase::SIMPLY_SUPPORTED_POINT,
 *                         10.0, 100e3, 5.0, 200e9, 3.375e-4);
 *   double M_mid = solver.moment(5.0);  // 250e3 N·m
 */
class LoadCaseSolver {
public:
    /**
     * @brief Construct the solver and compute reactions
     * @param beam_case Support × load combination
     * @param L Span [m]
     * @param load Point load P [N] or distributed load w [N/m]
     * @param a Point load position [m] (ignored for UDL cases)
     * @param E Young's modulus [Pa]
     * @param I Second moment of area [m⁴]
     *
     * @throws std::invalid_argument if L, load, E or I is not positive and
     *         finite, or a point load position lies outside [0, L]
     */
    LoadCaseSolver(BeamCase beam_case, double L, double load, double a,
                   double E, double I);

    BeamCase beam_case() const { return beam_case_; }
    double span() const { return L_; }

    /**
     * @brief Support reactions [N] and, for cantilevers, r2 [N·m]
     */
    const Reactions& reactions() const { return reactions_; }

    /**
     * @brief Bending moment at position x
     * @param x Position along beam [0, L]
     * @return Bending moment [N·m]
     */
    double moment(double x) const;

    /**
     * @brief Shear force at position x
     *
     * At the point load position the value just to the right of the load
     * is returned.
     *
     * @param x Position along beam [0, L]
     * @return Shear force [N]
     */
    double shear(double x) const;

    /**
     * @brief Elastic deflection at position x
     * @param x Position along beam [0, L]
     * @return Deflection [m]
     */
    double deflection(double x) const;

    /**
     * @brief Analytic peak bending moment and where it occurs
     *
     * Signed value [N·m]: P·a·b/L at x = a and w·L²/8 at x = L/2 for simply
     * supported beams; the fixed-end moment r2 at x = 0 for cantilevers.
     * Exact, independent of any sampling.
     */
    ActionExtreme peak_moment() const;

    /**
     * @brief Analytic peak shear magnitude [N]
     *
     * max(|r1|, |r2|) for a simply supported point load, the end reaction
     * w·L/2 for a simply supported UDL and r1 for cantilevers.
     */
    double peak_shear() const;

private:
    BeamCase beam_case_;
    double L_, load_, a_, EI_;
    Reactions reactions_;

    void compute_reactions();

    double simply_supported_point_moment(double x) const;
    double simply_supported_udl_moment(double x) const;
    double cantilever_point_moment(double x) const;
    double cantilever_udl_moment(double x) const;

    double simply_supported_point_shear(double x) const;
    double simply_supported_udl_shear(double x) const;
    double cantilever_point_shear(double x) const;
    double cantilever_udl_shear(double x) const;

    double simply_supported_point_deflection(double x) const;
    double simply_supported_udl_deflection(double x) const;
    double cantilever_point_deflection(double x) const;
    double cantilever_udl_deflection(double x) const;
};

} // namespace beamcalc
