#include "beamcalc/cross_section.hpp"
#include "beamcalc/units.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace beamcalc {

namespace {

bool is_positive(double value) {
    return std::isfinite(value) && value > 0.0;
}

double rectangle_inertia(double b, double h) {
    return b * h * h * h / 12.0;
}

} // namespace

CrossSection::CrossSection()
    : shape(SectionShape::Rectangular), width(0.0), height(0.0),
      flange_thickness(0.0), web_thickness(0.0),
      moment_of_inertia_cm4(0.0), fibre_distance_mm(0.0) {
}

CrossSection CrossSection::rectangular(double width, double height) {
    CrossSection section;
    section.shape = SectionShape::Rectangular;
    section.width = width;
    section.height = height;
    return section;
}

CrossSection CrossSection::i_beam(double width, double height,
                                  double flange_thickness, double web_thickness) {
    CrossSection section;
    section.shape = SectionShape::IBeam;
    section.width = width;
    section.height = height;
    section.flange_thickness = flange_thickness;
    section.web_thickness = web_thickness;
    return section;
}

CrossSection CrossSection::custom(double moment_of_inertia_cm4, double fibre_distance_mm) {
    CrossSection section;
    section.shape = SectionShape::Custom;
    section.moment_of_inertia_cm4 = moment_of_inertia_cm4;
    section.fibre_distance_mm = fibre_distance_mm;
    return section;
}

std::string CrossSection::describe() const {
    std::ostringstream oss;
    switch (shape) {
        case SectionShape::Rectangular:
            oss << "rectangular (" << width << "x" << height << "mm)";
            break;
        case SectionShape::IBeam:
            oss << "i-beam (" << width << "x" << height << "mm, tf=" << flange_thickness
                << "mm, tw=" << web_thickness << "mm)";
            break;
        case SectionShape::Custom:
            oss << "custom (I=" << moment_of_inertia_cm4 << " cm4, c=" << fibre_distance_mm << " mm)";
            break;
    }
    return oss.str();
}

BeamcalcError CrossSectionResolver::validate(const CrossSection& section) {
    switch (section.shape) {
        case SectionShape::Rectangular:
            if (!is_positive(section.width)) {
                return BeamcalcError::invalid_geometry("width", section.width,
                    "width must be positive");
            }
            if (!is_positive(section.height)) {
                return BeamcalcError::invalid_geometry("height", section.height,
                    "height must be positive");
            }
            return BeamcalcError();

        case SectionShape::IBeam:
            if (!is_positive(section.width)) {
                return BeamcalcError::invalid_geometry("width", section.width,
                    "flange width must be positive");
            }
            if (!is_positive(section.height)) {
                return BeamcalcError::invalid_geometry("height", section.height,
                    "height must be positive");
            }
            if (!is_positive(section.flange_thickness)) {
                return BeamcalcError::invalid_geometry("flange_thickness", section.flange_thickness,
                    "flange thickness must be positive");
            }
            if (!is_positive(section.web_thickness)) {
                return BeamcalcError::invalid_geometry("web_thickness", section.web_thickness,
                    "web thickness must be positive");
            }
            if (section.web_thickness >= section.width) {
                return BeamcalcError::invalid_geometry("web_thickness", section.web_thickness,
                    "web thickness must be less than the flange width");
            }
            if (2.0 * section.flange_thickness >= section.height) {
                return BeamcalcError::invalid_geometry("flange_thickness", section.flange_thickness,
                    "two flange thicknesses must be less than the section height");
            }
            return BeamcalcError();

        case SectionShape::Custom:
            if (!is_positive(section.moment_of_inertia_cm4)) {
                return BeamcalcError::invalid_geometry("moment_of_inertia",
                    section.moment_of_inertia_cm4, "moment of inertia must be positive");
            }
            if (!is_positive(section.fibre_distance_mm)) {
                return BeamcalcError::invalid_geometry("fibre_distance",
                    section.fibre_distance_mm, "distance to extreme fibre must be positive");
            }
            return BeamcalcError();
    }
    return BeamcalcError(ErrorCode::UNKNOWN_ERROR, "Unknown section shape");
}

SectionProperties CrossSectionResolver::resolve(const CrossSection& section) {
    BeamcalcError err = validate(section);
    if (err.is_error()) {
        throw std::invalid_argument(err.to_string());
    }

    switch (section.shape) {
        case SectionShape::Rectangular:
            return resolve_rectangular(section);
        case SectionShape::IBeam:
            return resolve_i_beam(section);
        case SectionShape::Custom:
            return resolve_custom(section);
        default:
            throw std::runtime_error("Unknown section shape");
    }
}

SectionProperties CrossSectionResolver::resolve_rectangular(const CrossSection& section) {
    double b = units::mm_to_m(section.width);
    double h = units::mm_to_m(section.height);

    SectionProperties props;
    props.I = rectangle_inertia(b, h);
    props.c = h / 2.0;
    props.A = b * h;
    return props;
}

SectionProperties CrossSectionResolver::resolve_i_beam(const CrossSection& section) {
    double b = units::mm_to_m(section.width);
    double h = units::mm_to_m(section.height);
    double tf = units::mm_to_m(section.flange_thickness);
    double tw = units::mm_to_m(section.web_thickness);

    // Gross rectangle minus the two voids beside the web
    double void_width = b - tw;
    double void_height = h - 2.0 * tf;

    SectionProperties props;
    props.I = rectangle_inertia(b, h) - rectangle_inertia(void_width, void_height);
    props.c = h / 2.0;
    props.A = b * h - void_width * void_height;
    return props;
}

SectionProperties CrossSectionResolver::resolve_custom(const CrossSection& section) {
    SectionProperties props;
    props.I = units::cm4_to_m4(section.moment_of_inertia_cm4);
    props.c = units::mm_to_m(section.fibre_distance_mm);
    props.A = 0.0;
    return props;
}

} // namespace beamcalc
