/**
 * @file safety_validator.hpp
 * @brief Four-layer safety check over one pipeline run
 */

#pragma once

#include <axioms/axiom_grounder.hpp>
#include <cognitive/reasoning_types.hpp>
#include <config/engine_config.hpp>
#include <export.hpp>
#include <string>

namespace Russell {

struct SafetyChecks {
    bool logical_consistency = false;  // Grounding proof verifies
    bool no_contradictions = false;    // Reasoning found none
    bool ethical_alignment = false;    // No harm vocabulary in the query
    bool system_stability = false;     // Path store below its bound

    bool all_passed() const {
        return logical_consistency && no_contradictions && ethical_alignment && system_stability;
    }
};

class RUSSELL_API SafetyValidator {
public:
    explicit SafetyValidator(const SafetyConfig& config = SafetyConfig{}) : config_(config) {}

    SafetyChecks validate(const std::string& query,
                          const GroundedStatement& grounding,
                          const ReasoningResult& reasoning,
                          size_t paths_stored) const;

    static bool mentions_harm(const std::string& text);

private:
    SafetyConfig config_;
};

} // namespace Russell
