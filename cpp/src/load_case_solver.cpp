#include "beamcalc/load_case_solver.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace beamcalc {

namespace {

void require_positive(double value, const std::string& name) {
    if (!(std::isfinite(value) && value > 0.0)) {
        throw std::invalid_argument("LoadCaseSolver: " + name +
                                    " must be positive and finite, got " + std::to_string(value));
    }
}

// -0.0 compares equal to 0.0; report it as +0.0
double without_negative_zero(double value) {
    return value == 0.0 ? 0.0 : value;
}

bool is_point_load(BeamCase beam_case) {
    return beam_case == BeamCase::SIMPLY_SUPPORTED_POINT ||
           beam_case == BeamCase::CANTILEVER_POINT;
}

} // namespace

BeamCase classify_beam_case(SupportType support, LoadType load_type) {
    if (support == SupportType::SimplySupported) {
        return load_type == LoadType::Point ? BeamCase::SIMPLY_SUPPORTED_POINT
                                            : BeamCase::SIMPLY_SUPPORTED_UDL;
    }
    return load_type == LoadType::Point ? BeamCase::CANTILEVER_POINT
                                        : BeamCase::CANTILEVER_UDL;
}

LoadCaseSolver::LoadCaseSolver(BeamCase beam_case, double L, double load, double a,
                               double E, double I)
    : beam_case_(beam_case), L_(L), load_(load), a_(a), EI_(E * I) {
    require_positive(L, "span");
    require_positive(load, "load");
    require_positive(E, "elastic modulus");
    require_positive(I, "moment of inertia");

    if (is_point_load(beam_case)) {
        if (!(a >= 0.0 && a <= L)) {
            throw std::invalid_argument("LoadCaseSolver: load position " + std::to_string(a) +
                                        " outside [0, " + std::to_string(L) + "]");
        }
    } else {
        a_ = 0.0;
    }

    compute_reactions();
}

void LoadCaseSolver::compute_reactions() {
    double L = L_;
    switch (beam_case_) {
        case BeamCase::SIMPLY_SUPPORTED_POINT: {
            double P = load_, a = a_, b = L - a_;
            reactions_ = Reactions(P * b / L, P * a / L);
            break;
        }
        case BeamCase::SIMPLY_SUPPORTED_UDL: {
            double w = load_;
            reactions_ = Reactions(w * L / 2.0, w * L / 2.0);
            break;
        }
        case BeamCase::CANTILEVER_POINT: {
            // r1: vertical reaction, r2: fixed-end moment
            double P = load_;
            reactions_ = Reactions(P, -P * a_);
            break;
        }
        case BeamCase::CANTILEVER_UDL: {
            double w = load_;
            reactions_ = Reactions(w * L, -w * L * L / 2.0);
            break;
        }
        default:
            throw std::runtime_error("Unknown beam case");
    }

    // A cantilever point load at a = 0 gives r2 = -P * 0
    reactions_.r1 = without_negative_zero(reactions_.r1);
    reactions_.r2 = without_negative_zero(reactions_.r2);
}

double LoadCaseSolver::moment(double x) const {
    switch (beam_case_) {
        case BeamCase::SIMPLY_SUPPORTED_POINT:
            return simply_supported_point_moment(x);
        case BeamCase::SIMPLY_SUPPORTED_UDL:
            return simply_supported_udl_moment(x);
        case BeamCase::CANTILEVER_POINT:
            return cantilever_point_moment(x);
        case BeamCase::CANTILEVER_UDL:
            return cantilever_udl_moment(x);
        default:
            throw std::runtime_error("Unknown beam case");
    }
}

double LoadCaseSolver::shear(double x) const {
    switch (beam_case_) {
        case BeamCase::SIMPLY_SUPPORTED_POINT:
            return simply_supported_point_shear(x);
        case BeamCase::SIMPLY_SUPPORTED_UDL:
            return simply_supported_udl_shear(x);
        case BeamCase::CANTILEVER_POINT:
            return cantilever_point_shear(x);
        case BeamCase::CANTILEVER_UDL:
            return cantilever_udl_shear(x);
        default:
            throw std::runtime_error("Unknown beam case");
    }
}

double LoadCaseSolver::deflection(double x) const {
    switch (beam_case_) {
        case BeamCase::SIMPLY_SUPPORTED_POINT:
            return simply_supported_point_deflection(x);
        case BeamCase::SIMPLY_SUPPORTED_UDL:
            return simply_supported_udl_deflection(x);
        case BeamCase::CANTILEVER_POINT:
            return cantilever_point_deflection(x);
        case BeamCase::CANTILEVER_UDL:
            return cantilever_udl_deflection(x);
        default:
            throw std::runtime_error("Unknown beam case");
    }
}

ActionExtreme LoadCaseSolver::peak_moment() const {
    double L = L_;
    switch (beam_case_) {
        case BeamCase::SIMPLY_SUPPORTED_POINT: {
            double P = load_, a = a_, b = L - a_;
            return ActionExtreme(a, without_negative_zero(P * a * b / L));
        }
        case BeamCase::SIMPLY_SUPPORTED_UDL:
            return ActionExtreme(L / 2.0, load_ * L * L / 8.0);
        case BeamCase::CANTILEVER_POINT:
        case BeamCase::CANTILEVER_UDL:
            return ActionExtreme(0.0, reactions_.r2);
        default:
            throw std::runtime_error("Unknown beam case");
    }
}

double LoadCaseSolver::peak_shear() const {
    switch (beam_case_) {
        case BeamCase::SIMPLY_SUPPORTED_POINT:
            return std::max(std::abs(reactions_.r1), std::abs(reactions_.r2));
        case BeamCase::SIMPLY_SUPPORTED_UDL:
        case BeamCase::CANTILEVER_POINT:
        case BeamCase::CANTILEVER_UDL:
            return std::abs(reactions_.r1);
        default:
            throw std::runtime_error("Unknown beam case");
    }
}

// ============================================================================
// Simply supported, point load P at x = a (b = L - a)
// ============================================================================

double LoadCaseSolver::simply_supported_point_moment(double x) const {
    double r1 = reactions_.r1;
    if (x <= a_) {
        return r1 * x;
    }
    return r1 * x - load_ * (x - a_);
}

double LoadCaseSolver::simply_supported_point_shear(double x) const {
    double r1 = reactions_.r1;
    return x < a_ ? r1 : r1 - load_;
}

double LoadCaseSolver::simply_supported_point_deflection(double x) const {
    double L = L_, P = load_, a = a_, b = L - a_;
    if (x <= a) {
        return (P * b * x) / (6.0 * EI_ * L) * (L * L - b * b - x * x);
    }
    double xr = L - x;  // distance from the right support
    return (P * a * xr) / (6.0 * EI_ * L) * (L * L - a * a - xr * xr);
}

// ============================================================================
// Simply supported, uniform load w
// ============================================================================

double LoadCaseSolver::simply_supported_udl_moment(double x) const {
    return reactions_.r1 * x - load_ * x * x / 2.0;
}

double LoadCaseSolver::simply_supported_udl_shear(double x) const {
    return reactions_.r1 - load_ * x;
}

double LoadCaseSolver::simply_supported_udl_deflection(double x) const {
    double L = L_, w = load_;
    return (w * x) / (24.0 * EI_) * (L * L * L - 2.0 * L * x * x + x * x * x);
}

// ============================================================================
// Cantilever fixed at x = 0, point load P at x = a
//
// Moment and shear are zero beyond the load position. This matches the
// tip-load case exactly; for a < L it is a simplified model (see the
// SIMPLIFIED_CANTILEVER_MODEL warning).
// ============================================================================

double LoadCaseSolver::cantilever_point_moment(double x) const {
    if (x < a_) {
        return reactions_.r2 + reactions_.r1 * x;
    }
    return 0.0;
}

double LoadCaseSolver::cantilever_point_shear(double x) const {
    return x < a_ ? reactions_.r1 : 0.0;
}

double LoadCaseSolver::cantilever_point_deflection(double x) const {
    double P = load_, a = a_;
    if (x <= a) {
        return (P * x * x) / (6.0 * EI_) * (3.0 * a - x);
    }
    // Rigid rotation beyond the load
    return (P * a * a) / (6.0 * EI_) * (3.0 * x - a);
}

// ============================================================================
// Cantilever fixed at x = 0, uniform load w
// ============================================================================

double LoadCaseSolver::cantilever_udl_moment(double x) const {
    return reactions_.r2 + reactions_.r1 * x - load_ * x * x / 2.0;
}

double LoadCaseSolver::cantilever_udl_shear(double x) const {
    return reactions_.r1 - load_ * x;
}

double LoadCaseSolver::cantilever_udl_deflection(double x) const {
    double L = L_, w = load_;
    return (w * x * x) / (24.0 * EI_) * (x * x + 6.0 * L * L - 4.0 * L * x);
}

} // namespace beamcalc
