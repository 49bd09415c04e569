#pragma once

#include <optional>
#include <string>
#include <vector>

namespace beamcalc {

/**
 * @brief Material stiffness for beam analysis
 *
 * Only the elastic modulus enters the beam formulas. Stored in display
 * units:
 * - E: Young's modulus [GPa]
 *
 * Presets cover the materials offered by the calculator:
 * Steel (200 GPa), Aluminum (69 GPa) and Concrete (30 GPa).
 */
class Material {
public:
    std::string name;   ///< Material name
    double E_gpa;       ///< Young's modulus [GPa]

    /**
     * @brief Construct a new Material
     *
     * @param name Material name
     * @param E_gpa Young's modulus [GPa]
     */
    Material(std::string name, double E_gpa);

    /**
     * @brief Young's modulus in SI units
     * @return double E [Pa]
     */
    double E_pa() const;

    /**
     * @brief All built-in material presets, in menu order
     */
    static std::vector<Material> presets();

    /**
     * @brief Look up a preset by name (case sensitive, e.g. "Steel")
     * @return std::optional<Material> The preset, or empty if unknown
     */
    static std::optional<Material> find_preset(const std::string& name);
};

} // namespace beamcalc
