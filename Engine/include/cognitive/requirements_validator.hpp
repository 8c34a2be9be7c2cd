/**
 * @file requirements_validator.hpp
 * @brief Ten pass/fail checks over the engine's running record
 *
 * Evaluated after every process() call and on get_metrics(). Each check
 * reads only what the engine already tracks: grounding samples, stored
 * paths, Λ, R3 cycles, recent safety results and convergence.
 */

#pragma once

#include <export.hpp>
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace Russell {

struct RequirementCheck {
    std::string name;
    bool met = false;
};

struct RUSSELL_API RequirementsReport {
    std::vector<RequirementCheck> checks;   // Fixed order, one per requirement

    bool all_met() const;
    double score() const;                   // Fraction met, 0 when empty
    std::vector<std::string> unmet() const;
};

/**
 * @brief Counters for one evaluation, read from the core under its lock
 */
struct RequirementInputs {
    std::deque<bool> recent_safety;          // all_passed() of the newest paths
    size_t queries_processed = 0;
    size_t paths_stored = 0;
    size_t axioms_loaded = 0;
    size_t cycles_completed = 0;
    double lambda_total = 0.0;
    double avg_emergence = 0.0;
    double convergence_confidence = 0.0;
};

class RUSSELL_API RequirementsValidator {
public:
    static constexpr double GROUNDING_TARGET = 0.95;    // Mean grounding certainty
    static constexpr double STEP_TRACE_FLOOR = 0.8;     // Every recent sample above this
    static constexpr size_t STEP_TRACE_WINDOW = 10;
    static constexpr size_t SAFETY_WINDOW = 5;

    /**
     * @param grounding_samples Grounding certainties in arrival order
     */
    static RequirementsReport evaluate(const std::vector<double>& grounding_samples,
                                       const RequirementInputs& inputs);
};

} // namespace Russell
