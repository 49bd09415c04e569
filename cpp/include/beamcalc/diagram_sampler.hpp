#pragma once

#include "beamcalc/internal_actions.hpp"
#include "beamcalc/load_case_solver.hpp"

#include <Eigen/Dense>
#include <vector>

namespace beamcalc {

/**
 * @brief Sampled moment, shear and deflection lines in SI units
 *
 * Column vectors of equal length, one entry per sample position:
 * - x [m], moment [N·m], shear [N], deflection [m]
 */
struct DiagramSeries {
    Eigen::VectorXd x;
    Eigen::VectorXd moment;
    Eigen::VectorXd shear;
    Eigen::VectorXd deflection;

    Eigen::Index size() const { return x.size(); }
};

/**
 * @brief Discretizes the span into evenly spaced diagram points
 *
 * Positions are x_i = (L / 100) · i for i = 0..100; the last position is
 * exactly L. Sampling is deterministic: the same solver always yields the
 * same sequence.
 */
class DiagramSampler {
public:
    /// Number of intervals between sample positions (101 points)
    static const int NUM_INTERVALS = 100;

    /**
     * @brief Evaluate the solver's x-functions at every sample position
     * @param solver Solver for the beam case (provides the span L)
     * @return DiagramSeries SI values, NUM_INTERVALS + 1 entries
     */
    static DiagramSeries sample_series(const LoadCaseSolver& solver);

    /**
     * @brief Sample the beam and convert to display units
     *
     * Moment [kN·m] and shear [kN] are rounded to two decimals, deflection
     * is converted to [mm], x is reported unrounded [m].
     *
     * @param solver Solver for the beam case (provides the span L)
     * @return std::vector<DiagramPoint> Ascending in x, NUM_INTERVALS + 1 points
     */
    static std::vector<DiagramPoint> sample(const LoadCaseSolver& solver);

    /**
     * @brief Convert an SI series to display-unit diagram points
     */
    static std::vector<DiagramPoint> to_points(const DiagramSeries& series);
};

} // namespace beamcalc
