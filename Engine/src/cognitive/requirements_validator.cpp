#include <cognitive/requirements_validator.hpp>
#include <Eigen/Core>
#include <algorithm>
#include <cstddef>

namespace Russell {

bool RequirementsReport::all_met() const {
    return !checks.empty() && std::all_of(checks.begin(), checks.end(),
        [](const RequirementCheck& c) { return c.met; });
}

double RequirementsReport::score() const {
    if (checks.empty()) return 0.0;
    auto met = std::count_if(checks.begin(), checks.end(),
        [](const RequirementCheck& c) { return c.met; });
    return static_cast<double>(met) / static_cast<double>(checks.size());
}

std::vector<std::string> RequirementsReport::unmet() const {
    std::vector<std::string> names;
    for (const auto& c : checks) {
        if (!c.met) names.push_back(c.name);
    }
    return names;
}

RequirementsReport RequirementsValidator::evaluate(const std::vector<double>& samples,
                                                   const RequirementInputs& in) {
    double grounding_avg = 0.0;
    if (!samples.empty()) {
        grounding_avg = Eigen::Map<const Eigen::VectorXd>(
            samples.data(), static_cast<Eigen::Index>(samples.size())).mean();
    }

    // Empty history fails: nothing has been traced yet
    bool steps_traced = false;
    if (!samples.empty()) {
        size_t n = std::min(STEP_TRACE_WINDOW, samples.size());
        steps_traced = std::all_of(samples.end() - static_cast<std::ptrdiff_t>(n), samples.end(),
            [](double s) { return s > STEP_TRACE_FLOOR; });
    }

    bool safety_held = !in.recent_safety.empty() &&
        std::all_of(in.recent_safety.begin(), in.recent_safety.end(), [](bool b) { return b; });

    RequirementsReport report;
    report.checks = {
        {"axiom_grounded_reasoning", grounding_avg >= GROUNDING_TARGET},
        {"steps_trace_to_axioms", steps_traced},
        {"ontological_grounding_complete", grounding_avg >= GROUNDING_TARGET},
        {"reasoning_paths_stored", in.paths_stored == in.queries_processed},
        {"axiom_table_loaded", in.axioms_loaded > 0},
        {"lambda_tracked", in.lambda_total > 0.0},
        {"self_optimizing_cycles", in.cycles_completed > 0},
        {"safety_validated", safety_held},
        {"emergence_tracked", in.avg_emergence >= 0.0},
        {"convergence_detected", in.convergence_confidence > 0.0}
    };
    return report;
}

} // namespace Russell
