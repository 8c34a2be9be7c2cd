#include <cognitive/improvement_handlers.hpp>
#include <utils/text.hpp>
#include <array>
#include <cmath>
#include <stdexcept>

namespace Russell {

namespace {

std::string increase_depth(const ImprovementProposal& proposal, EngineState& state) {
    if (!std::isfinite(proposal.target_value) || proposal.target_value < 1.0) {
        throw std::invalid_argument("Reasoning depth target must be at least 1");
    }
    int previous = state.tuning().reasoning_depth;
    int target = static_cast<int>(proposal.target_value);
    state.tuning().reasoning_depth = target;
    return "Reasoning depth " + std::to_string(previous) + " -> " + std::to_string(target);
}

std::string improve_certainty(const ImprovementProposal& proposal, EngineState& state) {
    if (!(proposal.current_value < proposal.target_value)) {
        throw std::invalid_argument("Certainty " + text::fixed(proposal.current_value, 2) +
                                    " already meets target " +
                                    text::fixed(proposal.target_value, 2));
    }
    auto& tuning = state.tuning();
    tuning.certainty_shortfalls++;
    tuning.last_certainty_gap = proposal.target_value - proposal.current_value;
    return "Certainty gap " + text::fixed(tuning.last_certainty_gap, 2) +
           " recorded (shortfall " + std::to_string(tuning.certainty_shortfalls) + ")";
}

std::string optimize_patterns(const ImprovementProposal& proposal, EngineState& state) {
    if (proposal.patterns.empty()) {
        throw std::invalid_argument("No patterns to optimize");
    }
    for (const auto& pattern : proposal.patterns) {
        state.tuning().optimized_patterns.insert(pattern);
    }
    return "Marked for optimization: " + text::join(proposal.patterns, ", ");
}

// Indexed by ImprovementKind
constexpr std::array<ImprovementHandler, kImprovementKindCount> kHandlers = {
    &increase_depth,
    &improve_certainty,
    &optimize_patterns,
};

} // namespace

ImprovementHandler handler_for(ImprovementKind kind) {
    return kHandlers.at(static_cast<size_t>(kind));
}

std::string apply_improvement(const ImprovementProposal& proposal, EngineState& state) {
    return handler_for(proposal.kind)(proposal, state);
}

} // namespace Russell
