/**
 * @file convergence_detector.hpp
 * @brief Whether Λ_total growth has stabilized
 */

#pragma once

#include <export.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace Russell {

struct ConvergenceReport {
    bool converged = false;
    double confidence = 0.0;   // [0, 1]
    double avg_change = 0.0;   // Mean |Δ| over the window
    double std_change = 0.0;   // Population stdev of Δ
    std::string trend = "insufficient_data";  // increasing | decreasing | stable
    size_t samples = 0;        // History length considered
};

/**
 * @brief Stateless analysis of a Λ_total history
 *
 * Needs at least 3 samples; otherwise not converged with confidence 0.
 * Over the last 5 samples:
 *   converged  = avg_change < 0.01 and std_change < 0.02
 *   confidence = 1 − min(1, avg_change × 10)
 */
class RUSSELL_API ConvergenceDetector {
public:
    static constexpr size_t MIN_SAMPLES = 3;
    static constexpr size_t WINDOW = 5;
    static constexpr double AVG_THRESHOLD = 0.01;
    static constexpr double STD_THRESHOLD = 0.02;

    static ConvergenceReport analyze(const std::vector<double>& history);
};

} // namespace Russell
