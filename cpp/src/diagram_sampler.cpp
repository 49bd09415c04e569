#include "beamcalc/diagram_sampler.hpp"
#include "beamcalc/units.hpp"

namespace beamcalc {

const int DiagramSampler::NUM_INTERVALS;

DiagramSeries DiagramSampler::sample_series(const LoadCaseSolver& solver) {
    const int n_points = NUM_INTERVALS + 1;
    double L = solver.span();
    double step = L / NUM_INTERVALS;

    DiagramSeries series;
    series.x.resize(n_points);
    series.moment.resize(n_points);
    series.shear.resize(n_points);
    series.deflection.resize(n_points);

    for (int i = 0; i < n_points; ++i) {
        // step * NUM_INTERVALS can differ from L in the last bit
        double x = (i == NUM_INTERVALS) ? L : step * i;
        series.x(i) = x;
        series.moment(i) = solver.moment(x);
        series.shear(i) = solver.shear(x);
        series.deflection(i) = solver.deflection(x);
    }

    return series;
}

std::vector<DiagramPoint> DiagramSampler::sample(const LoadCaseSolver& solver) {
    return to_points(sample_series(solver));
}

std::vector<DiagramPoint> DiagramSampler::to_points(const DiagramSeries& series) {
    std::vector<DiagramPoint> points;
    points.reserve(static_cast<size_t>(series.size()));

    for (Eigen::Index i = 0; i < series.size(); ++i) {
        points.emplace_back(series.x(i),
                            units::round_to(units::n_to_kn(series.moment(i)), 2),
                            units::round_to(units::n_to_kn(series.shear(i)), 2),
                            units::m_to_mm(series.deflection(i)));
    }

    return points;
}

} // namespace beamcalc
