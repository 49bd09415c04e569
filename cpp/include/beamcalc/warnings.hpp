/**
 * @file warnings.hpp
 * @brief Warning system for questionable beam configurations.
 *
 * Warnings indicate potential issues that don't prevent analysis
 * but may indicate input errors or produce unreliable results.
 */

#ifndef BEAMCALC_WARNINGS_HPP
#define BEAMCALC_WARNINGS_HPP

#include <algorithm>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace beamcalc {

/**
 * @brief Warning codes for questionable beam configurations.
 *
 * These codes identify potential issues that don't block analysis
 * but may indicate modeling problems.
 */
enum class WarningCode {
    // === Geometry Warnings (100-199) ===

    /// Span/depth ratio is extreme (slender > 100 or deep < 2)
    EXTREME_ASPECT_RATIO = 100,

    // === Property Warnings (300-399) ===

    /// Elastic modulus may be in wrong units
    POSSIBLE_UNIT_ERROR = 301,

    // === Analysis Warnings (500-599) ===

    /// Large displacements detected (linear theory may be invalid)
    LARGE_DISPLACEMENT = 500,

    /// Peak bending stress exceeds the configured yield stress
    HIGH_STRESS = 501,

    /// Peak deflection exceeds the serviceability limit span/ratio
    EXCESSIVE_DEFLECTION = 502,

    /// Cantilever point load inside the span uses the simplified model
    SIMPLIFIED_CANTILEVER_MODEL = 503
};

/**
 * @brief Warning severity levels.
 */
enum class WarningSeverity {
    /// Minor issue, likely acceptable
    Low = 0,

    /// Potentially problematic, review recommended
    Medium = 1,

    /// Likely indicates an input error or unsafe design
    High = 2
};

/**
 * @brief Convert warning code to string representation.
 */
inline std::string warning_code_to_string(WarningCode code) {
    switch (code) {
        case WarningCode::EXTREME_ASPECT_RATIO: return "EXTREME_ASPECT_RATIO";
        case WarningCode::POSSIBLE_UNIT_ERROR: return "POSSIBLE_UNIT_ERROR";
        case WarningCode::LARGE_DISPLACEMENT: return "LARGE_DISPLACEMENT";
        case WarningCode::HIGH_STRESS: return "HIGH_STRESS";
        case WarningCode::EXCESSIVE_DEFLECTION: return "EXCESSIVE_DEFLECTION";
        case WarningCode::SIMPLIFIED_CANTILEVER_MODEL: return "SIMPLIFIED_CANTILEVER_MODEL";
        default: return "UNKNOWN_WARNING";
    }
}

/**
 * @brief Convert severity to string representation.
 */
inline std::string severity_to_string(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Low: return "LOW";
        case WarningSeverity::Medium: return "MEDIUM";
        case WarningSeverity::High: return "HIGH";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured warning information for beamcalc.
 */
struct BeamcalcWarning {
    /// Machine-readable warning code
    WarningCode code;

    /// Warning severity level
    WarningSeverity severity;

    /// Human-readable warning message
    std::string message;

    /// Input parameters involved in the warning
    std::vector<std::string> involved_parameters;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the warning
    std::string suggestion;

    /**
     * @brief Construct warning with code, severity, and message.
     */
    BeamcalcWarning(WarningCode code, WarningSeverity severity, const std::string& message)
        : code(code), severity(severity), message(message) {}

    /**
     * @brief Get string representation of the warning code.
     */
    std::string code_string() const { return warning_code_to_string(code); }

    /**
     * @brief Get string representation of the severity.
     */
    std::string severity_string() const { return severity_to_string(severity); }

    /**
     * @brief Get formatted warning string for display.
     */
    std::string to_string() const {
        std::string result = "[" + severity_string() + "] [" + code_string() + "] " + message;

        if (!involved_parameters.empty()) {
            result += "\n  Parameters: ";
            for (size_t i = 0; i < involved_parameters.size(); ++i) {
                if (i > 0) result += ", ";
                result += involved_parameters[i];
            }
        }

        for (const auto& kv : details) {
            result += "\n  " + kv.first + ": " + kv.second;
        }

        if (!suggestion.empty()) {
            result += "\n  Suggestion: " + suggestion;
        }

        return result;
    }

    // === Factory methods for common warnings ===

    /**
     * @brief Create warning for extreme span/depth ratio.
     */
    static BeamcalcWarning extreme_aspect_ratio(double ratio, double slender_limit) {
        BeamcalcWarning warn(WarningCode::EXTREME_ASPECT_RATIO, WarningSeverity::Medium,
            "Beam has extreme span to depth ratio");
        warn.involved_parameters.push_back("span");
        warn.involved_parameters.push_back("cross_section");
        warn.details["span_to_depth_ratio"] = std::to_string(ratio);
        warn.suggestion = ratio > slender_limit
            ? "Very slender beam - check lateral stability and deflection limits"
            : "Very deep beam - shear deformation is not included in these results";
        return warn;
    }

    /**
     * @brief Create warning for a modulus outside the range of common materials.
     */
    static BeamcalcWarning possible_unit_error(double modulus_gpa) {
        BeamcalcWarning warn(WarningCode::POSSIBLE_UNIT_ERROR, WarningSeverity::Medium,
            "Elastic modulus is outside the range of common structural materials");
        warn.involved_parameters.push_back("elastic_modulus");
        warn.details["elastic_modulus"] = std::to_string(modulus_gpa) + " GPa";
        warn.suggestion = "Elastic modulus is entered in GPa (steel: 200, concrete: 30)";
        return warn;
    }

    /**
     * @brief Create warning for large displacement.
     */
    static BeamcalcWarning large_displacement(double deflection_mm, double ratio) {
        BeamcalcWarning warn(WarningCode::LARGE_DISPLACEMENT, WarningSeverity::Medium,
            "Large displacement detected - linear analysis may be invalid");
        warn.details["max_deflection"] = std::to_string(deflection_mm) + " mm";
        warn.details["deflection_to_span_ratio"] = std::to_string(ratio);
        warn.suggestion = "Small-deflection beam theory assumes deflections well below 1% of span";
        return warn;
    }

    /**
     * @brief Create warning for stress above yield.
     */
    static BeamcalcWarning high_stress(double stress_mpa, double yield_mpa) {
        BeamcalcWarning warn(WarningCode::HIGH_STRESS, WarningSeverity::High,
            "Peak bending stress exceeds the yield stress");
        warn.involved_parameters.push_back("cross_section");
        warn.details["max_stress"] = std::to_string(stress_mpa) + " MPa";
        warn.details["yield_stress"] = std::to_string(yield_mpa) + " MPa";
        warn.suggestion = "Increase the section size or reduce the load";
        return warn;
    }

    /**
     * @brief Create warning for deflection beyond the serviceability limit.
     */
    static BeamcalcWarning excessive_deflection(double deflection_mm, double limit_mm,
                                                double limit_ratio) {
        BeamcalcWarning warn(WarningCode::EXCESSIVE_DEFLECTION, WarningSeverity::Low,
            "Peak deflection exceeds the serviceability limit");
        warn.details["max_deflection"] = std::to_string(deflection_mm) + " mm";
        warn.details["limit"] = "L/" + std::to_string(static_cast<int>(limit_ratio)) +
                                " = " + std::to_string(limit_mm) + " mm";
        warn.suggestion = "Increase the second moment of area or use a stiffer material";
        return warn;
    }

    /**
     * @brief Create warning for a cantilever point load short of the free tip.
     */
    static BeamcalcWarning simplified_cantilever_model(double position, double span) {
        BeamcalcWarning warn(WarningCode::SIMPLIFIED_CANTILEVER_MODEL, WarningSeverity::Medium,
            "Cantilever point load is inside the span; moment and shear are reported "
            "as zero beyond the load position");
        warn.involved_parameters.push_back("load_position");
        warn.details["load_position"] = std::to_string(position) + " m";
        warn.details["span"] = std::to_string(span) + " m";
        warn.suggestion = "Results are exact for a tip load (position equal to span)";
        return warn;
    }
};

/**
 * @brief Plausibility warnings attached to one beam result.
 *
 * Filled by check_plausibility() in check order; emptied again if the
 * analysis is rejected after the checks ran.
 */
class WarningList {
public:
    /// Warnings in the order the checks raised them
    std::vector<BeamcalcWarning> warnings;

    void add(BeamcalcWarning warning) {
        warnings.push_back(std::move(warning));
    }

    bool has_warnings() const { return !warnings.empty(); }

    /**
     * @brief Check whether a given check fired.
     */
    bool contains(WarningCode code) const {
        return std::any_of(warnings.begin(), warnings.end(),
                           [code](const BeamcalcWarning& w) { return w.code == code; });
    }

    size_t count_by_severity(WarningSeverity severity) const {
        return static_cast<size_t>(std::count_if(
            warnings.begin(), warnings.end(),
            [severity](const BeamcalcWarning& w) { return w.severity == severity; }));
    }

    void clear() { warnings.clear(); }

    /**
     * @brief One line listing the raised codes with their severity.
     *
     * e.g. "2 warnings: EXTREME_ASPECT_RATIO (MEDIUM), LARGE_DISPLACEMENT (MEDIUM)"
     */
    std::string summary() const {
        if (warnings.empty()) return "No warnings";

        std::string result = std::to_string(warnings.size()) +
                             (warnings.size() == 1 ? " warning: " : " warnings: ");
        for (size_t i = 0; i < warnings.size(); ++i) {
            if (i > 0) result += ", ";
            result += warnings[i].code_string() + " (" + warnings[i].severity_string() + ")";
        }
        return result;
    }
};

}  // namespace beamcalc

#endif  // BEAMCALC_WARNINGS_HPP
