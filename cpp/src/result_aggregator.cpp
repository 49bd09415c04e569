#include "beamcalc/result_aggregator.hpp"
#include "beamcalc/units.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace beamcalc {

double BeamResult::moment_of_inertia_cm4() const {
    return units::m4_to_cm4(moment_of_inertia);
}

std::string BeamResult::summary() const {
    return support_type_to_string(support) + " Beam, " + load_type_to_string(load_type);
}

std::string BeamResult::to_string() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "Max Moment: " << std::abs(max_moment) << " kNm\n";
    oss << "Max Shear: " << max_shear << " kN\n";
    oss << "Max Stress: " << max_stress << " MPa\n";
    oss << "Max Deflection: " << max_deflection << " mm";
    return oss.str();
}

BeamResult ResultAggregator::aggregate(const LoadCaseSolver& solver,
                                       const DiagramSeries& series,
                                       const SectionProperties& section) {
    if (series.size() == 0) {
        throw std::invalid_argument("ResultAggregator: empty diagram series");
    }

    BeamResult result;
    switch (solver.beam_case()) {
        case BeamCase::SIMPLY_SUPPORTED_POINT:
            result.support = SupportType::SimplySupported;
            result.load_type = LoadType::Point;
            break;
        case BeamCase::SIMPLY_SUPPORTED_UDL:
            result.support = SupportType::SimplySupported;
            result.load_type = LoadType::UniformlyDistributed;
            break;
        case BeamCase::CANTILEVER_POINT:
            result.support = SupportType::Cantilever;
            result.load_type = LoadType::Point;
            break;
        case BeamCase::CANTILEVER_UDL:
            result.support = SupportType::Cantilever;
            result.load_type = LoadType::UniformlyDistributed;
            break;
    }

    // Analytic peaks (SI)
    ActionExtreme peak_moment = solver.peak_moment();
    double peak_shear = solver.peak_shear();
    double stress_pa = std::abs(peak_moment.value) * section.c / section.I;

    // Sampled peak deflection
    Eigen::Index i_max = 0;
    series.deflection.cwiseAbs().maxCoeff(&i_max);

    const Reactions& r = solver.reactions();
    result.reactions = Reactions(units::n_to_kn(r.r1), units::n_to_kn(r.r2));

    result.max_moment = units::n_to_kn(peak_moment.value);
    result.max_shear = units::n_to_kn(peak_shear);
    result.max_stress = units::pa_to_mpa(stress_pa);
    result.max_deflection = units::m_to_mm(std::abs(series.deflection(i_max)));

    result.moment_of_inertia = section.I;
    result.section_modulus = section.section_modulus();
    result.area = section.A;

    result.moment_extreme = ActionExtreme(peak_moment.x, result.max_moment);
    result.deflection_extreme = ActionExtreme(series.x(i_max),
                                              units::m_to_mm(series.deflection(i_max)));

    result.diagram = DiagramSampler::to_points(series);
    return result;
}

} // namespace beamcalc
