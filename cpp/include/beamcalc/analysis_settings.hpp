#pragma once

namespace beamcalc {

/**
 * @brief Configuration settings for a beam analysis
 *
 * Controls which plausibility warnings are raised and their thresholds.
 * The computed result itself does not depend on these settings.
 *
 * Usage:
 *   AnalysisSettings settings;
 *   settings.yield_stress_mpa = 235.0;      // Enable the stress check
 *   settings.deflection_limit_ratio = 360.0; // L/360 serviceability limit
 *   auto outcome = compute_beam_result(spec, settings);
 */
struct AnalysisSettings {
    /// Whether to run the plausibility checks at all
    bool emit_warnings = true;

    /// Serviceability limit: warn when max deflection > span / ratio
    double deflection_limit_ratio = 250.0;

    /// Warn when max deflection / span exceeds this (small-deflection theory)
    double large_displacement_ratio = 0.01;

    /// Warn when span / depth exceeds this (slender beam)
    double slender_ratio_limit = 100.0;

    /// Warn when span / depth is below this (deep beam)
    double deep_ratio_limit = 2.0;

    /// Yield stress for the stress check [MPa]; 0 disables the check
    double yield_stress_mpa = 0.0;

    /// Plausible range of elastic modulus [GPa]; outside raises a unit warning
    double min_modulus_gpa = 0.1;
    double max_modulus_gpa = 1000.0;
};

} // namespace beamcalc
