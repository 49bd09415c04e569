#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "beamcalc/units.hpp"
#include "beamcalc/cross_section.hpp"
#include "beamcalc/material.hpp"
#include "beamcalc/section_catalog.hpp"
#include "beamcalc/beam_spec.hpp"
#include "beamcalc/internal_actions.hpp"
#include "beamcalc/load_case_solver.hpp"
#include "beamcalc/diagram_sampler.hpp"
#include "beamcalc/result_aggregator.hpp"
#include "beamcalc/analysis_settings.hpp"
#include "beamcalc/beam_analyzer.hpp"
#include "beamcalc/errors.hpp"
#include "beamcalc/warnings.hpp"

namespace py = pybind11;

/**
 * beamcalc C++ Python bindings module.
 * This module exposes the beam analysis engine to Python via pybind11.
 */
PYBIND11_MODULE(_beamcalc_cpp, m) {
    m.doc() = "beamcalc C++ core module - Single-span beam analysis engine";

    // Version information
    m.attr("__version__") = "1.0.0";

    // ========================================================================
    // Units
    // ========================================================================

    py::module_ units = m.def_submodule("units", "Display unit <-> SI conversions");
    units.def("kn_to_n", &beamcalc::units::kn_to_n, py::arg("kn"));
    units.def("n_to_kn", &beamcalc::units::n_to_kn, py::arg("n"));
    units.def("gpa_to_pa", &beamcalc::units::gpa_to_pa, py::arg("gpa"));
    units.def("pa_to_gpa", &beamcalc::units::pa_to_gpa, py::arg("pa"));
    units.def("pa_to_mpa", &beamcalc::units::pa_to_mpa, py::arg("pa"));
    units.def("mm_to_m", &beamcalc::units::mm_to_m, py::arg("mm"));
    units.def("m_to_mm", &beamcalc::units::m_to_mm, py::arg("m"));
    units.def("cm4_to_m4", &beamcalc::units::cm4_to_m4, py::arg("cm4"));
    units.def("m4_to_cm4", &beamcalc::units::m4_to_cm4, py::arg("m4"));
    units.def("round_to", &beamcalc::units::round_to, py::arg("value"), py::arg("decimals"));

    // ========================================================================
    // Cross sections and materials
    // ========================================================================

    py::enum_<beamcalc::SectionShape>(m, "SectionShape",
        "Cross-section model")
        .value("Rectangular", beamcalc::SectionShape::Rectangular, "Solid rectangle")
        .value("IBeam", beamcalc::SectionShape::IBeam, "Doubly symmetric I-section")
        .value("Custom", beamcalc::SectionShape::Custom, "User-supplied I and c")
        .export_values();

    py::class_<beamcalc::CrossSection>(m, "CrossSection",
        "Cross-section description in display units [mm, cm4]")
        .def(py::init<>(), "Empty rectangular section")
        .def_readonly("shape", &beamcalc::CrossSection::shape, "Active section model")
        .def_readwrite("width", &beamcalc::CrossSection::width, "Width [mm]")
        .def_readwrite("height", &beamcalc::CrossSection::height, "Height [mm]")
        .def_readwrite("flange_thickness", &beamcalc::CrossSection::flange_thickness,
                       "Flange thickness [mm]")
        .def_readwrite("web_thickness", &beamcalc::CrossSection::web_thickness,
                       "Web thickness [mm]")
        .def_readwrite("moment_of_inertia_cm4", &beamcalc::CrossSection::moment_of_inertia_cm4,
                       "Second moment of area [cm4] (Custom)")
        .def_readwrite("fibre_distance_mm", &beamcalc::CrossSection::fibre_distance_mm,
                       "Distance to extreme fibre [mm] (Custom)")
        .def_static("rectangular", &beamcalc::CrossSection::rectangular,
                    py::arg("width"), py::arg("height"))
        .def_static("i_beam", &beamcalc::CrossSection::i_beam,
                    py::arg("width"), py::arg("height"),
                    py::arg("flange_thickness"), py::arg("web_thickness"))
        .def_static("custom", &beamcalc::CrossSection::custom,
                    py::arg("moment_of_inertia_cm4"), py::arg("fibre_distance_mm"))
        .def("describe", &beamcalc::CrossSection::describe)
        .def("__repr__", [](const beamcalc::CrossSection &s) {
            return "<CrossSection " + s.describe() + ">";
        });

    py::class_<beamcalc::SectionProperties>(m, "SectionProperties",
        "Resolved section properties in SI units")
        .def(py::init<>())
        .def_readwrite("I", &beamcalc::SectionProperties::I, "Second moment of area [m4]")
        .def_readwrite("c", &beamcalc::SectionProperties::c, "Extreme fibre distance [m]")
        .def_readwrite("A", &beamcalc::SectionProperties::A, "Area [m2]")
        .def("section_modulus", &beamcalc::SectionProperties::section_modulus,
             "Elastic section modulus I/c [m3]");

    py::class_<beamcalc::CrossSectionResolver>(m, "CrossSectionResolver",
        "Derives I and c from a cross-section description")
        .def_static("validate", &beamcalc::CrossSectionResolver::validate,
                    py::arg("section"))
        .def_static("resolve", &beamcalc::CrossSectionResolver::resolve,
                    py::arg("section"),
                    "Compute section properties (raises ValueError on invalid geometry)");

    py::class_<beamcalc::StandardSection>(m, "StandardSection")
        .def_readonly("name", &beamcalc::StandardSection::name)
        .def_readonly("section", &beamcalc::StandardSection::section);

    m.def("standard_sections", &beamcalc::standard_sections, py::arg("shape"),
          "Catalogue sections of the given shape");
    m.def("find_standard_section", &beamcalc::find_standard_section, py::arg("name"),
          "Look up a catalogue section by designation");

    py::class_<beamcalc::Material>(m, "Material",
        "Material stiffness [GPa]")
        .def(py::init<std::string, double>(), py::arg("name"), py::arg("E_gpa"))
        .def_readwrite("name", &beamcalc::Material::name)
        .def_readwrite("E_gpa", &beamcalc::Material::E_gpa, "Young's modulus [GPa]")
        .def("E_pa", &beamcalc::Material::E_pa, "Young's modulus [Pa]")
        .def_static("presets", &beamcalc::Material::presets)
        .def_static("find_preset", &beamcalc::Material::find_preset, py::arg("name"))
        .def("__repr__", [](const beamcalc::Material &mat) {
            return "<Material " + mat.name + " E=" + std::to_string(mat.E_gpa) + " GPa>";
        });

    // ========================================================================
    // Beam specification
    // ========================================================================

    py::enum_<beamcalc::SupportType>(m, "SupportType", "Support condition")
        .value("SimplySupported", beamcalc::SupportType::SimplySupported)
        .value("Cantilever", beamcalc::SupportType::Cantilever)
        .export_values();

    py::enum_<beamcalc::LoadType>(m, "LoadType", "Load pattern")
        .value("Point", beamcalc::LoadType::Point)
        .value("UniformlyDistributed", beamcalc::LoadType::UniformlyDistributed)
        .export_values();

    py::class_<beamcalc::BeamSpec>(m, "BeamSpec",
        "Beam analysis request in display units [m, kN, kN/m, GPa]")
        .def(py::init<>())
        .def(py::init<double, beamcalc::SupportType, beamcalc::LoadType, double, double,
                      const beamcalc::CrossSection&, double>(),
             py::arg("span"), py::arg("support"), py::arg("load_type"),
             py::arg("load_magnitude"), py::arg("load_position"),
             py::arg("cross_section"), py::arg("elastic_modulus"))
        .def_readwrite("span", &beamcalc::BeamSpec::span, "Span [m]")
        .def_readwrite("support", &beamcalc::BeamSpec::support)
        .def_readwrite("load_type", &beamcalc::BeamSpec::load_type)
        .def_readwrite("load_magnitude", &beamcalc::BeamSpec::load_magnitude,
                       "P [kN] or w [kN/m]")
        .def_readwrite("load_position", &beamcalc::BeamSpec::load_position,
                       "Point load position [m]")
        .def_readwrite("cross_section", &beamcalc::BeamSpec::cross_section)
        .def_readwrite("elastic_modulus", &beamcalc::BeamSpec::elastic_modulus, "E [GPa]");

    // ========================================================================
    // Solver and sampling
    // ========================================================================

    py::class_<beamcalc::Reactions>(m, "Reactions")
        .def(py::init<>())
        .def_readwrite("r1", &beamcalc::Reactions::r1)
        .def_readwrite("r2", &beamcalc::Reactions::r2)
        .def("__repr__", [](const beamcalc::Reactions &r) {
            return "<Reactions r1=" + std::to_string(r.r1) + " r2=" + std::to_string(r.r2) + ">";
        });

    py::class_<beamcalc::DiagramPoint>(m, "DiagramPoint",
        "Diagram values at one position [m, kN·m, kN, mm]")
        .def(py::init<>())
        .def_readwrite("x", &beamcalc::DiagramPoint::x)
        .def_readwrite("moment", &beamcalc::DiagramPoint::moment)
        .def_readwrite("shear", &beamcalc::DiagramPoint::shear)
        .def_readwrite("deflection", &beamcalc::DiagramPoint::deflection);

    py::class_<beamcalc::ActionExtreme>(m, "ActionExtreme",
        "Extremum location and value")
        .def(py::init<>())
        .def_readwrite("x", &beamcalc::ActionExtreme::x)
        .def_readwrite("value", &beamcalc::ActionExtreme::value);

    py::enum_<beamcalc::BeamCase>(m, "BeamCase", "Support x load combination")
        .value("SIMPLY_SUPPORTED_POINT", beamcalc::BeamCase::SIMPLY_SUPPORTED_POINT)
        .value("SIMPLY_SUPPORTED_UDL", beamcalc::BeamCase::SIMPLY_SUPPORTED_UDL)
        .value("CANTILEVER_POINT", beamcalc::BeamCase::CANTILEVER_POINT)
        .value("CANTILEVER_UDL", beamcalc::BeamCase::CANTILEVER_UDL)
        .export_values();

    m.def("classify_beam_case", &beamcalc::classify_beam_case,
          py::arg("support"), py::arg("load_type"));

    py::class_<beamcalc::LoadCaseSolver>(m, "LoadCaseSolver",
        "Closed-form reactions, moment, shear and deflection (SI units)")
        .def(py::init<beamcalc::BeamCase, double, double, double, double, double>(),
             py::arg("beam_case"), py::arg("L"), py::arg("load"), py::arg("a"),
             py::arg("E"), py::arg("I"))
        .def("beam_case", &beamcalc::LoadCaseSolver::beam_case)
        .def("span", &beamcalc::LoadCaseSolver::span)
        .def("reactions", &beamcalc::LoadCaseSolver::reactions)
        .def("moment", &beamcalc::LoadCaseSolver::moment, py::arg("x"), "Moment [N·m]")
        .def("shear", &beamcalc::LoadCaseSolver::shear, py::arg("x"), "Shear [N]")
        .def("deflection", &beamcalc::LoadCaseSolver::deflection, py::arg("x"),
             "Deflection [m]")
        .def("peak_moment", &beamcalc::LoadCaseSolver::peak_moment)
        .def("peak_shear", &beamcalc::LoadCaseSolver::peak_shear);

    py::class_<beamcalc::DiagramSeries>(m, "DiagramSeries",
        "Sampled lines in SI units")
        .def_readonly("x", &beamcalc::DiagramSeries::x)
        .def_readonly("moment", &beamcalc::DiagramSeries::moment)
        .def_readonly("shear", &beamcalc::DiagramSeries::shear)
        .def_readonly("deflection", &beamcalc::DiagramSeries::deflection);

    py::class_<beamcalc::DiagramSampler>(m, "DiagramSampler")
        .def_readonly_static("NUM_INTERVALS", &beamcalc::DiagramSampler::NUM_INTERVALS)
        .def_static("sample_series", &beamcalc::DiagramSampler::sample_series, py::arg("solver"))
        .def_static("sample", &beamcalc::DiagramSampler::sample, py::arg("solver"));

    // ========================================================================
    // Results and analysis
    // ========================================================================

    py::class_<beamcalc::BeamResult>(m, "BeamResult",
        "Beam analysis result in display units")
        .def_readonly("support", &beamcalc::BeamResult::support)
        .def_readonly("load_type", &beamcalc::BeamResult::load_type)
        .def_readonly("max_moment", &beamcalc::BeamResult::max_moment, "[kN·m], signed")
        .def_readonly("max_shear", &beamcalc::BeamResult::max_shear, "[kN]")
        .def_readonly("max_stress", &beamcalc::BeamResult::max_stress, "[MPa]")
        .def_readonly("max_deflection", &beamcalc::BeamResult::max_deflection, "[mm]")
        .def_readonly("moment_of_inertia", &beamcalc::BeamResult::moment_of_inertia, "[m4]")
        .def_readonly("section_modulus", &beamcalc::BeamResult::section_modulus, "[m3]")
        .def_readonly("area", &beamcalc::BeamResult::area, "[m2]")
        .def_readonly("reactions", &beamcalc::BeamResult::reactions)
        .def_readonly("diagram", &beamcalc::BeamResult::diagram)
        .def_readonly("moment_extreme", &beamcalc::BeamResult::moment_extreme)
        .def_readonly("deflection_extreme", &beamcalc::BeamResult::deflection_extreme)
        .def("moment_of_inertia_cm4", &beamcalc::BeamResult::moment_of_inertia_cm4)
        .def("summary", &beamcalc::BeamResult::summary)
        .def("to_string", &beamcalc::BeamResult::to_string)
        .def("__str__", &beamcalc::BeamResult::to_string);

    py::class_<beamcalc::AnalysisSettings>(m, "AnalysisSettings",
        "Warning thresholds for beam analysis")
        .def(py::init<>())
        .def_readwrite("emit_warnings", &beamcalc::AnalysisSettings::emit_warnings)
        .def_readwrite("deflection_limit_ratio", &beamcalc::AnalysisSettings::deflection_limit_ratio)
        .def_readwrite("large_displacement_ratio",
                       &beamcalc::AnalysisSettings::large_displacement_ratio)
        .def_readwrite("slender_ratio_limit", &beamcalc::AnalysisSettings::slender_ratio_limit)
        .def_readwrite("deep_ratio_limit", &beamcalc::AnalysisSettings::deep_ratio_limit)
        .def_readwrite("yield_stress_mpa", &beamcalc::AnalysisSettings::yield_stress_mpa)
        .def_readwrite("min_modulus_gpa", &beamcalc::AnalysisSettings::min_modulus_gpa)
        .def_readwrite("max_modulus_gpa", &beamcalc::AnalysisSettings::max_modulus_gpa);

    // ErrorCode enum
    py::enum_<beamcalc::ErrorCode>(m, "ErrorCode",
        "Error codes for rejected beam analyses")
        .value("OK", beamcalc::ErrorCode::OK, "No error")
        .value("INVALID_GEOMETRY", beamcalc::ErrorCode::INVALID_GEOMETRY,
               "Invalid cross-section dimensions")
        .value("INVALID_LOAD", beamcalc::ErrorCode::INVALID_LOAD,
               "Non-positive span, load or elastic modulus")
        .value("OUT_OF_RANGE_POSITION", beamcalc::ErrorCode::OUT_OF_RANGE_POSITION,
               "Point load outside the span")
        .value("NUMERICAL_OVERFLOW", beamcalc::ErrorCode::NUMERICAL_OVERFLOW,
               "Numerical overflow during computation")
        .value("UNKNOWN_ERROR", beamcalc::ErrorCode::UNKNOWN_ERROR,
               "Unknown error")
        .export_values();

    // BeamcalcError class
    py::class_<beamcalc::BeamcalcError>(m, "BeamcalcError",
        "Structured error information with machine-readable code and diagnostics")
        .def(py::init<>(), "Create OK (no error) status")
        .def(py::init<beamcalc::ErrorCode, const std::string&>(),
             py::arg("code"), py::arg("message"))
        .def_readwrite("code", &beamcalc::BeamcalcError::code, "Error code")
        .def_readwrite("message", &beamcalc::BeamcalcError::message, "Error message")
        .def_readwrite("involved_parameters", &beamcalc::BeamcalcError::involved_parameters,
                       "Input parameters involved in the error")
        .def_readwrite("details", &beamcalc::BeamcalcError::details,
                       "Additional diagnostic details (key-value pairs)")
        .def_readwrite("suggestion", &beamcalc::BeamcalcError::suggestion,
                       "Suggested fix for the error")
        .def("is_ok", &beamcalc::BeamcalcError::is_ok, "Check if no error")
        .def("is_error", &beamcalc::BeamcalcError::is_error, "Check if error occurred")
        .def("code_string", &beamcalc::BeamcalcError::code_string)
        .def("to_string", &beamcalc::BeamcalcError::to_string)
        .def("__repr__", [](const beamcalc::BeamcalcError &e) {
            if (e.is_ok()) return std::string("<BeamcalcError OK>");
            return "<BeamcalcError " + e.code_string() + ": " + e.message + ">";
        })
        .def("__str__", &beamcalc::BeamcalcError::to_string)
        .def("__bool__", [](const beamcalc::BeamcalcError &e) {
            return e.is_error();  // True if error, False if OK
        });

    // WarningCode enum
    py::enum_<beamcalc::WarningCode>(m, "WarningCode",
        "Warning codes for questionable beam configurations")
        .value("EXTREME_ASPECT_RATIO", beamcalc::WarningCode::EXTREME_ASPECT_RATIO,
               "Extreme span to depth ratio")
        .value("POSSIBLE_UNIT_ERROR", beamcalc::WarningCode::POSSIBLE_UNIT_ERROR,
               "Elastic modulus may be in wrong units")
        .value("LARGE_DISPLACEMENT", beamcalc::WarningCode::LARGE_DISPLACEMENT,
               "Large displacement, linear theory questionable")
        .value("HIGH_STRESS", beamcalc::WarningCode::HIGH_STRESS,
               "Stress above yield")
        .value("EXCESSIVE_DEFLECTION", beamcalc::WarningCode::EXCESSIVE_DEFLECTION,
               "Deflection above serviceability limit")
        .value("SIMPLIFIED_CANTILEVER_MODEL", beamcalc::WarningCode::SIMPLIFIED_CANTILEVER_MODEL,
               "Cantilever point load inside the span")
        .export_values();

    py::enum_<beamcalc::WarningSeverity>(m, "WarningSeverity", "Warning severity levels")
        .value("Low", beamcalc::WarningSeverity::Low)
        .value("Medium", beamcalc::WarningSeverity::Medium)
        .value("High", beamcalc::WarningSeverity::High)
        .export_values();

    py::class_<beamcalc::BeamcalcWarning>(m, "BeamcalcWarning",
        "Structured warning information")
        .def(py::init<beamcalc::WarningCode, beamcalc::WarningSeverity, const std::string&>(),
             py::arg("code"), py::arg("severity"), py::arg("message"))
        .def_readwrite("code", &beamcalc::BeamcalcWarning::code)
        .def_readwrite("severity", &beamcalc::BeamcalcWarning::severity)
        .def_readwrite("message", &beamcalc::BeamcalcWarning::message)
        .def_readwrite("involved_parameters", &beamcalc::BeamcalcWarning::involved_parameters)
        .def_readwrite("details", &beamcalc::BeamcalcWarning::details)
        .def_readwrite("suggestion", &beamcalc::BeamcalcWarning::suggestion)
        .def("code_string", &beamcalc::BeamcalcWarning::code_string)
        .def("severity_string", &beamcalc::BeamcalcWarning::severity_string)
        .def("to_string", &beamcalc::BeamcalcWarning::to_string)
        .def("__str__", &beamcalc::BeamcalcWarning::to_string);

    py::class_<beamcalc::WarningList>(m, "WarningList",
        "Collection of analysis warnings")
        .def(py::init<>())
        .def_readonly("warnings", &beamcalc::WarningList::warnings)
        .def("has_warnings", &beamcalc::WarningList::has_warnings)
        .def("contains", &beamcalc::WarningList::contains, py::arg("code"))
        .def("count_by_severity", &beamcalc::WarningList::count_by_severity,
             py::arg("severity"))
        .def("summary", &beamcalc::WarningList::summary)
        .def("clear", &beamcalc::WarningList::clear)
        .def("__len__", [](const beamcalc::WarningList &list) {
            return list.warnings.size();
        });

    py::class_<beamcalc::AnalysisOutcome>(m, "AnalysisOutcome",
        "Result or typed error of compute_beam_result")
        .def_readonly("result", &beamcalc::AnalysisOutcome::result)
        .def_readonly("error", &beamcalc::AnalysisOutcome::error)
        .def_readonly("warnings", &beamcalc::AnalysisOutcome::warnings)
        .def("is_ok", &beamcalc::AnalysisOutcome::is_ok)
        .def("value", &beamcalc::AnalysisOutcome::value,
             py::return_value_policy::reference_internal,
             "Result (raises RuntimeError if the request was rejected)");

    m.def("validate_beam_spec", &beamcalc::validate_beam_spec, py::arg("spec"),
          "Check all preconditions of a beam analysis request");

    m.def("compute_beam_result", &beamcalc::compute_beam_result,
          py::arg("spec"), py::arg("settings") = beamcalc::AnalysisSettings{},
          "Analyze a single-span beam");
}
