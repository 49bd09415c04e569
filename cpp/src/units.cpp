#include "beamcalc/units.hpp"

#include <cmath>

namespace beamcalc {
namespace units {

double kn_to_n(double kn) {
    return kn * 1000.0;
}

double n_to_kn(double n) {
    return n / 1000.0;
}

double gpa_to_pa(double gpa) {
    return gpa * 1e9;
}

double pa_to_gpa(double pa) {
    return pa / 1e9;
}

double pa_to_mpa(double pa) {
    return pa / 1e6;
}

double mm_to_m(double mm) {
    return mm / 1000.0;
}

double m_to_mm(double m) {
    return m * 1000.0;
}

double cm4_to_m4(double cm4) {
    return cm4 / 1e8;
}

double m4_to_cm4(double m4) {
    return m4 * 1e8;
}

double round_to(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    double rounded = std::round(value * scale) / scale;
    // Avoid reporting -0.00
    return rounded == 0.0 ? 0.0 : rounded;
}

} // namespace units
} // namespace beamcalc
