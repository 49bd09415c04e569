#pragma once

namespace beamcalc {

/**
 * @brief Scalar conversions between display units and base SI units
 *
 * Display units are the units a user enters and reads:
 * - Force: kN, moment: kN·m, distributed load: kN/m
 * - Elastic modulus: GPa, stress: MPa
 * - Section dimensions and deflection: mm
 * - Second moment of area: cm⁴
 *
 * All computation inside beamcalc is performed in N, m, Pa and m⁴.
 * Conversions are applied only at the input and output boundary.
 */
namespace units {

double kn_to_n(double kn);
double n_to_kn(double n);

double gpa_to_pa(double gpa);
double pa_to_gpa(double pa);

double pa_to_mpa(double pa);

double mm_to_m(double mm);
double m_to_mm(double m);

double cm4_to_m4(double cm4);
double m4_to_cm4(double m4);

/**
 * @brief Round a value to a fixed number of decimal places
 *
 * Used for moment and shear diagram values, which are reported with two
 * decimals. Halfway cases round away from zero.
 *
 * @param value Value to round
 * @param decimals Number of decimal places (>= 0)
 * @return double Rounded value
 */
double round_to(double value, int decimals);

} // namespace units

} // namespace beamcalc
