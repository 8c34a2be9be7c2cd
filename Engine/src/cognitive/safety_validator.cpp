#include <cognitive/safety_validator.hpp>
#include <utils/text.hpp>

namespace Russell {

bool SafetyValidator::mentions_harm(const std::string& text) {
    static const std::vector<std::string> vocabulary = {"harm", "hurt", "kill", "steal"};
    return text::contains_any(text, vocabulary);
}

SafetyChecks SafetyValidator::validate(const std::string& query,
                                       const GroundedStatement& grounding,
                                       const ReasoningResult& reasoning,
                                       size_t paths_stored) const {
    SafetyChecks checks;
    checks.logical_consistency = grounding.verify_proof();
    checks.no_contradictions = reasoning.contradictions.empty();
    checks.ethical_alignment = !mentions_harm(query);
    checks.system_stability = paths_stored < config_.max_paths;
    return checks;
}

} // namespace Russell
