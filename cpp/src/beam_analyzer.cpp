#include "beamcalc/beam_analyzer.hpp"
#include "beamcalc/diagram_sampler.hpp"
#include "beamcalc/load_case_solver.hpp"
#include "beamcalc/units.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace beamcalc {

namespace {

bool is_positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

bool is_strictly_ascending(const Eigen::VectorXd& x) {
    Eigen::Index n = x.size();
    if (n < 2) return true;
    return ((x.tail(n - 1) - x.head(n - 1)).array() > 0.0).all();
}

/**
 * @brief Name of the first non-finite quantity in a result, or empty
 */
std::string find_non_finite(const BeamResult& result) {
    if (!std::isfinite(result.reactions.r1) || !std::isfinite(result.reactions.r2)) {
        return "reactions";
    }
    if (!std::isfinite(result.max_moment)) return "max_moment";
    if (!std::isfinite(result.max_shear)) return "max_shear";
    if (!std::isfinite(result.max_stress)) return "max_stress";
    if (!std::isfinite(result.max_deflection)) return "max_deflection";
    if (!std::isfinite(result.section_modulus)) return "section_modulus";
    if (!std::isfinite(result.area)) return "area";

    for (const auto& p : result.diagram) {
        if (!std::isfinite(p.moment) || !std::isfinite(p.shear) ||
            !std::isfinite(p.deflection)) {
            return "diagram";
        }
    }
    return "";
}

} // namespace

const BeamResult& AnalysisOutcome::value() const {
    if (!result) {
        throw std::runtime_error("No beam result available: " + error.to_string());
    }
    return *result;
}

BeamcalcError validate_beam_spec(const BeamSpec& spec) {
    if (!is_positive(spec.span)) {
        return BeamcalcError::invalid_load("span", spec.span);
    }
    if (!is_positive(spec.load_magnitude)) {
        return BeamcalcError::invalid_load("load_magnitude", spec.load_magnitude);
    }
    if (!is_positive(spec.elastic_modulus)) {
        return BeamcalcError::invalid_load("elastic_modulus", spec.elastic_modulus);
    }

    if (spec.load_type == LoadType::Point) {
        double a = spec.load_position;
        if (!(a >= 0.0 && a <= spec.span)) {
            return BeamcalcError::out_of_range_position(a, spec.span);
        }
    }

    return CrossSectionResolver::validate(spec.cross_section);
}

AnalysisOutcome compute_beam_result(const BeamSpec& spec, const AnalysisSettings& settings) {
    AnalysisOutcome outcome;

    outcome.error = validate_beam_spec(spec);
    if (outcome.error.is_error()) {
        return outcome;
    }

    try {
        // Step 1: Convert inputs to SI
        double L = spec.span;
        double load = units::kn_to_n(spec.load_magnitude);  // N or N/m
        double E = units::gpa_to_pa(spec.elastic_modulus);
        double a = spec.load_type == LoadType::Point ? spec.load_position : 0.0;

        if (!std::isfinite(load)) {
            outcome.error = BeamcalcError::numerical_overflow("load_magnitude");
            return outcome;
        }
        if (!std::isfinite(E)) {
            outcome.error = BeamcalcError::numerical_overflow("elastic_modulus");
            return outcome;
        }

        // Step 2: Section properties
        SectionProperties section = CrossSectionResolver::resolve(spec.cross_section);
        if (!is_positive(section.I) || !is_positive(section.c)) {
            outcome.error = BeamcalcError::numerical_overflow("section_properties");
            return outcome;
        }

        // Step 3: Reactions and x-functions
        LoadCaseSolver solver(classify_beam_case(spec.support, spec.load_type),
                              L, load, a, E, section.I);

        // Step 4: Sample and aggregate
        DiagramSeries series = DiagramSampler::sample_series(solver);
        if (!is_strictly_ascending(series.x)) {
            // Span too small to hold NUM_INTERVALS distinct positions
            outcome.error = BeamcalcError::numerical_overflow(
                "span", "underflowed: diagram positions are not distinct");
            return outcome;
        }
        BeamResult result = ResultAggregator::aggregate(solver, series, section);

        std::string bad_quantity = find_non_finite(result);
        if (!bad_quantity.empty()) {
            outcome.error = BeamcalcError::numerical_overflow(bad_quantity);
            return outcome;
        }

        if (settings.emit_warnings) {
            outcome.warnings = check_plausibility(spec, section, result, settings);
        }
        outcome.result = std::move(result);

    } catch (const std::exception& e) {
        outcome.result.reset();
        outcome.warnings.clear();
        outcome.error = BeamcalcError(ErrorCode::UNKNOWN_ERROR,
                                      std::string("Analysis failed: ") + e.what());
    }

    return outcome;
}

WarningList check_plausibility(const BeamSpec& spec,
                               const SectionProperties& section,
                               const BeamResult& result,
                               const AnalysisSettings& settings) {
    WarningList warnings;
    double L = spec.span;

    // Span / depth
    double depth = section.depth();
    if (depth > 0.0) {
        double ratio = L / depth;
        if (ratio > settings.slender_ratio_limit || ratio < settings.deep_ratio_limit) {
            warnings.add(BeamcalcWarning::extreme_aspect_ratio(ratio, settings.slender_ratio_limit));
        }
    }

    // Modulus entered in the wrong unit (e.g. MPa or Pa instead of GPa)
    if (spec.elastic_modulus < settings.min_modulus_gpa ||
        spec.elastic_modulus > settings.max_modulus_gpa) {
        warnings.add(BeamcalcWarning::possible_unit_error(spec.elastic_modulus));
    }

    // Deflection checks
    double deflection_m = units::mm_to_m(result.max_deflection);
    double deflection_ratio = deflection_m / L;
    if (deflection_ratio > settings.large_displacement_ratio) {
        warnings.add(BeamcalcWarning::large_displacement(result.max_deflection, deflection_ratio));
    }

    if (settings.deflection_limit_ratio > 0.0) {
        double limit_mm = units::m_to_mm(L / settings.deflection_limit_ratio);
        if (result.max_deflection > limit_mm) {
            warnings.add(BeamcalcWarning::excessive_deflection(
                result.max_deflection, limit_mm, settings.deflection_limit_ratio));
        }
    }

    // Stress check
    if (settings.yield_stress_mpa > 0.0 && result.max_stress > settings.yield_stress_mpa) {
        warnings.add(BeamcalcWarning::high_stress(result.max_stress, settings.yield_stress_mpa));
    }

    if (spec.support == SupportType::Cantilever && spec.load_type == LoadType::Point &&
        spec.load_position < L) {
        warnings.add(BeamcalcWarning::simplified_cantilever_model(spec.load_position, L));
    }

    return warnings;
}

} // namespace beamcalc
