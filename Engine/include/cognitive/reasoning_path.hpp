/**
 * @file reasoning_path.hpp
 * @brief Finalized record of one ground → reason → reflect run
 */

#pragma once

#include <cognitive/convergence_detector.hpp>
#include <cognitive/reasoning_types.hpp>
#include <cognitive/reflection_types.hpp>
#include <cognitive/requirements_validator.hpp>
#include <cognitive/safety_validator.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace Russell {

struct RUSSELL_API ReasoningPath {
    std::string id;                     // path_<n>_<unix seconds>
    std::string query;

    std::string grounding_hash;
    double grounding_certainty = 0.0;
    std::vector<std::string> axioms_used;
    bool grounding_fallback = false;

    ReasoningResult reasoning;
    ReflectionCycle cycle;

    int reasoning_depth = 0;
    double emergence = 0.0;             // Cycle emergence
    double lambda_impact = 0.0;
    SafetyChecks safety;
    ConvergenceReport convergence;
    RequirementsReport requirements;    // Engine-wide, evaluated after this path; not hashed

    double timestamp = 0.0;
    std::string hash;
    bool persisted = false;             // Set after the sink accepts it; not hashed

    std::string compute_hash() const;
};

} // namespace Russell
