#include "beamcalc/material.hpp"
#include "beamcalc/units.hpp"

#include <utility>

namespace beamcalc {

Material::Material(std::string name, double E_gpa)
    : name(std::move(name)), E_gpa(E_gpa) {
}

double Material::E_pa() const {
    return units::gpa_to_pa(E_gpa);
}

std::vector<Material> Material::presets() {
    return {
        Material("Steel", 200.0),
        Material("Aluminum", 69.0),
        Material("Concrete", 30.0),
    };
}

std::optional<Material> Material::find_preset(const std::string& name) {
    for (const auto& material : presets()) {
        if (material.name == name) {
            return material;
        }
    }
    return std::nullopt;
}

} // namespace beamcalc
