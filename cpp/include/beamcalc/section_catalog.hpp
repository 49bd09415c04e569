#pragma once

#include "beamcalc/cross_section.hpp"

#include <optional>
#include <string>
#include <vector>

namespace beamcalc {

/**
 * @brief Named standard section with its dimensions
 */
struct StandardSection {
    std::string name;       ///< Catalogue designation, e.g. "IPE 120"
    CrossSection section;   ///< Dimensions [mm]
};

/**
 * @brief Standard sections of the given shape
 *
 * IBeam: IPE 80 to IPE 160. Rectangular: 150 x 300 mm to 300 x 600 mm.
 * Custom sections have no catalogue and return an empty list.
 */
std::vector<StandardSection> standard_sections(SectionShape shape);

/**
 * @brief Look up a standard section by designation
 * @param name Designation as listed, e.g. "IPE 100" or "200 x 400 mm"
 * @return std::optional<CrossSection> The section, or empty if unknown
 */
std::optional<CrossSection> find_standard_section(const std::string& name);

} // namespace beamcalc
