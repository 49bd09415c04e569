#include "beamcalc/section_catalog.hpp"

namespace beamcalc {

namespace {

StandardSection ipe(const std::string& name, double height, double width,
                    double web_thickness, double flange_thickness) {
    return {name, CrossSection::i_beam(width, height, flange_thickness, web_thickness)};
}

StandardSection rect(const std::string& name, double width, double height) {
    return {name, CrossSection::rectangular(width, height)};
}

} // namespace

std::vector<StandardSection> standard_sections(SectionShape shape) {
    switch (shape) {
        case SectionShape::IBeam:
            // name, h, b, tw, tf [mm]
            return {
                ipe("IPE 80", 80.0, 46.0, 3.8, 5.2),
                ipe("IPE 100", 100.0, 55.0, 4.1, 5.7),
                ipe("IPE 120", 120.0, 64.0, 4.4, 6.3),
                ipe("IPE 140", 140.0, 73.0, 4.7, 6.9),
                ipe("IPE 160", 160.0, 82.0, 5.0, 7.4),
            };
        case SectionShape::Rectangular:
            return {
                rect("150 x 300 mm", 150.0, 300.0),
                rect("200 x 400 mm", 200.0, 400.0),
                rect("250 x 500 mm", 250.0, 500.0),
                rect("300 x 600 mm", 300.0, 600.0),
            };
        case SectionShape::Custom:
        default:
            return {};
    }
}

std::optional<CrossSection> find_standard_section(const std::string& name) {
    for (SectionShape shape : {SectionShape::IBeam, SectionShape::Rectangular}) {
        for (const auto& entry : standard_sections(shape)) {
            if (entry.name == name) {
                return entry.section;
            }
        }
    }
    return std::nullopt;
}

} // namespace beamcalc
