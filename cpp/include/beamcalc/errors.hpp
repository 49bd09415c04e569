/**
 * @file errors.hpp
 * @brief Structured error handling for beamcalc.
 *
 * This file defines error codes and error structures for reporting
 * rejected analysis requests in a machine-readable format. A rejected
 * request is a normal outcome: the caller is expected to inspect the
 * error and ask the user to correct the offending input.
 */

#ifndef BEAMCALC_ERRORS_HPP
#define BEAMCALC_ERRORS_HPP

#include <string>
#include <vector>
#include <map>
#include <sstream>

namespace beamcalc {

/**
 * @brief Error codes for beamcalc analysis failures.
 *
 * These codes provide machine-readable error identification.
 * Each code corresponds to a specific type of failure.
 */
enum class ErrorCode {
    /// No error - analysis completed successfully
    OK = 0,

    // === Section Errors (200-299) ===

    /// Non-positive or structurally inconsistent cross-section dimensions
    INVALID_GEOMETRY = 200,

    // === Load Errors (300-399) ===

    /// Non-positive span length, load magnitude or elastic modulus
    INVALID_LOAD = 300,

    /// Point load position outside [0, L]
    OUT_OF_RANGE_POSITION = 301,

    // === Numerical Errors (500-599) ===

    /// Value outside the representable range (non-finite result, or a
    /// span too small to sample)
    NUMERICAL_OVERFLOW = 501,

    // === Generic Errors (900-999) ===

    /// Unknown or unspecified error
    UNKNOWN_ERROR = 999
};

/**
 * @brief Convert error code to string representation.
 */
inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_GEOMETRY: return "INVALID_GEOMETRY";
        case ErrorCode::INVALID_LOAD: return "INVALID_LOAD";
        case ErrorCode::OUT_OF_RANGE_POSITION: return "OUT_OF_RANGE_POSITION";
        case ErrorCode::NUMERICAL_OVERFLOW: return "NUMERICAL_OVERFLOW";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        default: return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Structured error information for beamcalc.
 *
 * Contains machine-readable error code, human-readable message,
 * and the names of the input parameters that caused the rejection.
 */
struct BeamcalcError {
    /// Machine-readable error code
    ErrorCode code;

    /// Human-readable error message
    std::string message;

    /// Input parameters involved in the error (e.g. "span", "web_thickness")
    std::vector<std::string> involved_parameters;

    /// Additional key-value details for diagnostics
    std::map<std::string, std::string> details;

    /// Suggested fix for the error
    std::string suggestion;

    /**
     * @brief Default constructor creates OK status.
     */
    BeamcalcError()
        : code(ErrorCode::OK), message("OK") {}

    /**
     * @brief Construct error with code and message.
     */
    BeamcalcError(ErrorCode code, const std::string& message)
        : code(code), message(message) {}

    /**
     * @brief Check if this represents a successful state.
     */
    bool is_ok() const { return code == ErrorCode::OK; }

    /**
     * @brief Check if this represents an error state.
     */
    bool is_error() const { return code != ErrorCode::OK; }

    /**
     * @brief Get string representation of the error code.
     */
    std::string code_string() const { return error_code_to_string(code); }

    /**
     * @brief Get formatted error string for display.
     */
    std::string to_string() const {
        if (is_ok()) return "OK";

        std::string result = "[" + code_string() + "] " + message;

        if (!involved_parameters.empty()) {
            result += "\n  Involved parameters: ";
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

    // === Factory methods for common errors ===

    /**
     * @brief Create error for a rejected cross-section dimension.
     */
    static BeamcalcError invalid_geometry(const std::string& parameter, double value,
                                          const std::string& reason) {
        BeamcalcError err(ErrorCode::INVALID_GEOMETRY,
            "Invalid cross-section geometry: " + reason);
        err.involved_parameters.push_back(parameter);
        err.details[parameter] = format_value(value);
        err.suggestion = "Check the section dimensions. All dimensions must be positive, "
                        "the web must be thinner than the flange width and both flanges "
                        "together must be thinner than the section height.";
        return err;
    }

    /**
     * @brief Create error for a non-positive span, load magnitude or modulus.
     */
    static BeamcalcError invalid_load(const std::string& parameter, double value) {
        BeamcalcError err(ErrorCode::INVALID_LOAD,
            "Parameter '" + parameter + "' must be a positive finite number");
        err.involved_parameters.push_back(parameter);
        err.details[parameter] = format_value(value);
        err.suggestion = "Enter a value greater than zero.";
        return err;
    }

    /**
     * @brief Create error for a point load placed outside the span.
     */
    static BeamcalcError out_of_range_position(double position, double span) {
        BeamcalcError err(ErrorCode::OUT_OF_RANGE_POSITION,
            "Point load position lies outside the span");
        err.involved_parameters.push_back("load_position");
        err.details["load_position"] = format_value(position) + " m";
        err.details["span"] = format_value(span) + " m";
        err.suggestion = "Place the load between 0 and the span length.";
        return err;
    }

    /**
     * @brief Create error for a computation that left the representable range.
     *
     * @param quantity Name of the offending quantity
     * @param problem What went wrong, appended to the message
     */
    static BeamcalcError numerical_overflow(const std::string& quantity,
                                            const std::string& problem = "produced a non-finite value") {
        BeamcalcError err(ErrorCode::NUMERICAL_OVERFLOW,
            "Computation of " + quantity + " " + problem);
        err.involved_parameters.push_back(quantity);
        err.suggestion = "Input magnitudes are outside the representable range. "
                        "Check the units of the load, span and section values.";
        return err;
    }

private:
    static std::string format_value(double value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }
};

}  // namespace beamcalc

#endif  // BEAMCALC_ERRORS_HPP
