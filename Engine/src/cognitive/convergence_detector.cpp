#include <cognitive/convergence_detector.hpp>
#include <Eigen/Core>
#include <algorithm>
#include <cmath>

namespace Russell {

ConvergenceReport ConvergenceDetector::analyze(const std::vector<double>& history) {
    ConvergenceReport report;
    report.samples = history.size();
    if (history.size() < MIN_SAMPLES) return report;

    size_t n = std::min(WINDOW, history.size());
    Eigen::Map<const Eigen::VectorXd> window(history.data() + (history.size() - n),
                                             static_cast<Eigen::Index>(n));
    Eigen::VectorXd diff = window.tail(static_cast<Eigen::Index>(n - 1)) - window.head(static_cast<Eigen::Index>(n - 1));

    report.avg_change = diff.cwiseAbs().mean();
    double mean = diff.mean();
    report.std_change = std::sqrt((diff.array() - mean).square().mean());

    report.converged = report.avg_change < AVG_THRESHOLD && report.std_change < STD_THRESHOLD;
    report.confidence = std::clamp(1.0 - std::min(1.0, report.avg_change * 10.0), 0.0, 1.0);

    if (report.avg_change < AVG_THRESHOLD) report.trend = "stable";
    else report.trend = mean > 0.0 ? "increasing" : "decreasing";
    return report;
}

} // namespace Russell
