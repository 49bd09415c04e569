#pragma once

#include "beamcalc/analysis_settings.hpp"
#include "beamcalc/beam_spec.hpp"
#include "beamcalc/cross_section.hpp"
#include "beamcalc/errors.hpp"
#include "beamcalc/result_aggregator.hpp"
#include "beamcalc/warnings.hpp"

#include <optional>

namespace beamcalc {

/**
 * @brief Outcome of compute_beam_result()
 *
 * Either a complete result (error is OK) or a typed error with no result.
 * Warnings are only produced alongside a result.
 */
struct AnalysisOutcome {
    std::optional<BeamResult> result;  ///< Present if and only if error.is_ok()
    BeamcalcError error;               ///< OK, or the reason the request was rejected
    WarningList warnings;              ///< Plausibility warnings for a valid result

    bool is_ok() const { return error.is_ok(); }

    /**
     * @brief Access the result
     * @throws std::runtime_error if the request was rejected
     */
    const BeamResult& value() const;
};

/**
 * @brief Check every precondition of a beam analysis request
 *
 * Checked in order, the first failure is returned:
 * 1. span, load magnitude and elastic modulus positive and finite (INVALID_LOAD)
 * 2. point load position within [0, span] (OUT_OF_RANGE_POSITION)
 * 3. cross-section geometry (INVALID_GEOMETRY)
 *
 * @return BeamcalcError OK if the spec can be analyzed
 */
BeamcalcError validate_beam_spec(const BeamSpec& spec);

/**
 * @brief Analyze a single-span beam
 *
 * Pipeline: validate → convert to SI → resolve section (I, c) → solve
 * reactions → sample 101 points → aggregate peaks and stress → convert
 * back to display units.
 *
 * Pure function: no shared state, no I/O. Identical input gives a
 * bit-identical result, so concurrent calls need no locking.
 *
 * Usage:
 *   BeamSpec spec(10.0, SupportType::SimplySupported, LoadType::Point,
 *                 100.0, 5.0, CrossSection::rectangular(150, 300), 200.0);
 *   AnalysisOutcome outcome = compute_beam_result(spec);
 *   if (!outcome.is_ok()) {
 *       std::cerr << outcome.error.to_string() << std::endl;
 *   }
 *
 * @param spec Beam description in display units
 * @param settings Warning thresholds (do not affect the numbers)
 * @return AnalysisOutcome Result or typed error, never a partial result
 */
AnalysisOutcome compute_beam_result(const BeamSpec& spec,
                                    const AnalysisSettings& settings = AnalysisSettings{});

/**
 * @brief Plausibility checks on a computed result
 *
 * Runs the span/depth, modulus range, large displacement, serviceability,
 * yield stress and simplified cantilever model checks.
 */
WarningList check_plausibility(const BeamSpec& spec,
                               const SectionProperties& section,
                               const BeamResult& result,
                               const AnalysisSettings& settings);

} // namespace beamcalc
