#pragma once

namespace beamcalc {

/**
 * @brief Support reactions
 *
 * Simply supported: r1 and r2 are the vertical reactions at x = 0 and
 * x = L. Cantilever: r1 is the vertical reaction and r2 the moment
 * reaction at the fixed end (x = 0); r2 is negative (hogging).
 *
 * Units follow the context: [N] / [N·m] inside the solver,
 * [kN] / [kN·m] in a BeamResult.
 */
struct Reactions {
    double r1 = 0.0;
    double r2 = 0.0;

    Reactions() = default;
    Reactions(double r1, double r2) : r1(r1), r2(r2) {}
};

/**
 * @brief Internal actions and deflection at one position along the beam
 *
 * Display units: moment and shear are rounded to two decimals.
 */
struct DiagramPoint {
    double x = 0.0;           ///< Position along beam [0, L] [m]
    double moment = 0.0;      ///< Bending moment [kN·m] (positive = sagging)
    double shear = 0.0;       ///< Shear force [kN]
    double deflection = 0.0;  ///< Deflection [mm] (positive in load direction)

    DiagramPoint() = default;
    DiagramPoint(double position, double m, double v, double w)
        : x(position), moment(m), shear(v), deflection(w) {}
};

/**
 * @brief Extremum location and value
 *
 * Used to report moment/deflection extrema along the beam.
 */
struct ActionExtreme {
    double x = 0.0;      ///< Position along beam [m]
    double value = 0.0;  ///< Value at extremum

    ActionExtreme() = default;
    ActionExtreme(double pos, double val) : x(pos), value(val) {}
};

} // namespace beamcalc
