/**
 * @file cognitive_core.hpp
 * @brief Thread-safe facade over grounding, reasoning and reflection
 *
 * Owns the engine state and the three engines and serializes every
 * operation with one mutex, so concurrent request handlers see a strict
 * order of reflect() calls and a consistent Λ_total.
 *
 *   process(query):
 *     GROUND   → AxiomGrounder (context {query_number})
 *     REASON   → ReasoningEngine at the optimal depth
 *     REFLECT  → ReflectionEngine (one R3 cycle)
 *     RECORD   → ReasoningPath with safety checks, convergence and
 *                the requirements report
 *     PERSIST  → sink, after the lock is released
 */

#pragma once

#include <axioms/axiom_grounder.hpp>
#include <cognitive/convergence_detector.hpp>
#include <cognitive/engine_state.hpp>
#include <cognitive/reasoning_engine.hpp>
#include <cognitive/reasoning_path.hpp>
#include <cognitive/reflection_engine.hpp>
#include <cognitive/requirements_validator.hpp>
#include <cognitive/safety_validator.hpp>
#include <config/engine_config.hpp>
#include <storage/persistence_sink.hpp>
#include <export.hpp>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Russell {

struct EngineMetrics {
    double avg_certainty = 0.0;            // Mean reasoning certainty of caller queries
    double avg_emergence = 0.0;            // Mean cycle emergence
    double cache_hit_rate = 0.0;
    double lambda_total = 0.0;
    ConvergenceReport convergence;

    double avg_grounding_certainty = 0.0;
    double avg_reasoning_depth = 0.0;      // Over process() runs
    size_t queries_processed = 0;
    size_t cycles_completed = 0;
    size_t paths_stored = 0;
    size_t cache_size = 0;
    size_t improvements_applied = 0;
    size_t improvements_failed = 0;
    int reasoning_depth = 0;               // Current tuned baseline
    RequirementsReport requirements;
};

class RUSSELL_API CognitiveCore {
public:
    explicit CognitiveCore(const EngineConfig& config = EngineConfig{},
                           std::shared_ptr<PersistenceSink> sink = nullptr);

    CognitiveCore(const CognitiveCore&) = delete;
    CognitiveCore& operator=(const CognitiveCore&) = delete;

    GroundedStatement ground(const std::string& statement,
                             const Context& context = Context::object());

    ReasoningResult reason_about(const std::string& query, const Context& context, int depth);
    ReasoningResult reason_about(const std::string& query,
                                 const Context& context = Context::object());

    ReflectionOutcome reflect(const std::string& query,
                              const Context& context = Context::object());

    /**
     * @brief Full pipeline; the returned path carries `persisted`
     */
    ReasoningPath process(const std::string& query);

    EngineMetrics get_metrics() const;
    ConvergenceReport convergence() const;

    /**
     * @brief Tuned baseline + min(5, ⌊words/10 × 3⌋) + min(3, ⌊question ratio × 5⌋), capped
     */
    int optimal_depth(const std::string& query) const;

    // Concept graph
    void add_concept(const std::string& name);
    void relate(const std::string& from, const std::string& to);

    void set_sink(std::shared_ptr<PersistenceSink> sink);

    // Snapshots
    double lambda_total() const;
    std::vector<double> lambda_history() const;
    std::vector<ImprovementLogEntry> improvement_log() const;
    EngineTuning tuning() const;
    ReasoningStats reasoning_stats() const;
    GroundingMetrics grounding_metrics() const;

    const EngineConfig& config() const { return config_; }

private:
    int optimal_depth_locked(const std::string& query) const;
    RequirementsReport requirements_locked() const;

    EngineConfig config_;
    mutable std::mutex mutex_;

    EngineState state_;
    AxiomGrounder grounder_;
    ReasoningEngine reasoning_;
    ReflectionEngine reflection_;
    SafetyValidator safety_;
    std::shared_ptr<PersistenceSink> sink_;

    size_t queries_processed_ = 0;
    size_t paths_stored_ = 0;
    std::vector<double> grounding_samples_;
    std::vector<double> depth_samples_;
    std::deque<bool> recent_safety_;       // Newest SAFETY_WINDOW paths
};

} // namespace Russell
