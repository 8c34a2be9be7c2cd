/**
 * @file reflection_engine.hpp
 * @brief R3 reflection: Reflexive → Recursive → Regenerative → Transcendent
 *
 * A cycle runs the four levels of kReflectionSequence in order, every time:
 *
 *   REFLEXIVE:     reason at depth 1 about "Analyze what I'm doing: <query>"
 *   RECURSIVE:     thinking patterns, recursive structure, fixed points
 *                  (what one more refinement pass leaves unchanged)
 *   REGENERATIVE:  up to three improvement proposals (pure data)
 *   TRANSCENDENT:  framework synthesis when the rolling emergence mean
 *                  of the last five cycles reaches the target
 *
 * Cycle emergence is uncapped; its Λ impact is non-negative, so Λ_total
 * never decreases. Proposals are applied after the cycle is appended;
 * handler failures are logged and never invalidate the cycle.
 */

#pragma once

#include <cognitive/context.hpp>
#include <cognitive/engine_state.hpp>
#include <cognitive/reasoning_engine.hpp>
#include <cognitive/reflection_types.hpp>
#include <config/engine_config.hpp>
#include <export.hpp>
#include <string>
#include <vector>

namespace Russell {

class RUSSELL_API ReflectionEngine {
public:
    static constexpr const char* META_QUERY_PREFIX = "Analyze what I'm doing: ";

    ReflectionEngine(ReasoningEngine& reasoning, EngineState& state,
                     const ReflectionConfig& config = ReflectionConfig{});

    /**
     * @brief Run one full cycle, update Λ_total and apply its proposals
     */
    ReflectionOutcome reflect(const std::string& query,
                              const Context& context = Context::object());

    /**
     * @brief log2(1 + unique novel insights) × levels above 0.7 certainty × sqrt(total insights)
     *
     * Novel insights contain "new" or "create" (case-insensitive) and are
     * deduplicated by digest. Zero when there are none. Uncapped.
     */
    static double compute_emergence(const std::vector<LevelInsights>& levels);

    /**
     * @brief 1.5 at emergence ≥ 2.0, 1.2 at ≥ 1.0, else 0.8
     */
    static double emergence_multiplier(double emergence);

    /**
     * @brief base_growth × emergence_multiplier × (1 + 0.05 × cycles_completed)
     */
    double lambda_impact(double emergence, size_t cycles_completed) const;

    const ReflectionConfig& config() const { return config_; }

private:
    ReflexiveOutcome reflexive_level(const std::string& query, const Context& context);
    RecursiveOutcome recursive_level(const ReflexiveOutcome& reflexive);
    RegenerativeOutcome regenerative_level(const RecursiveOutcome& recursive) const;
    TranscendentOutcome transcendent_level(const RegenerativeOutcome& regenerative,
                                           size_t cycle_index) const;

    /**
     * @brief Invoke each proposal's handler; returns (applied, failed)
     */
    std::pair<size_t, size_t> apply_improvements(const ReflectionCycle& cycle);

    ReasoningEngine& reasoning_;
    EngineState& state_;
    ReflectionConfig config_;
};

} // namespace Russell
