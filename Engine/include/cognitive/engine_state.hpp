/**
 * @file engine_state.hpp
 * @brief Mutable engine state shared by reasoning and reflection
 *
 * Owns Λ_total and its history, the append-only cycle and emergence
 * histories, the reasoning cache, certainty samples, the improvement log and
 * the tuning record improvement handlers act on.
 *
 * Not synchronized; CognitiveCore serializes access.
 */

#pragma once

#include <cognitive/reasoning_types.hpp>
#include <cognitive/reflection_types.hpp>
#include <config/engine_config.hpp>
#include <export.hpp>
#include <deque>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace Russell {

/**
 * @brief Values improvement handlers may change
 */
struct EngineTuning {
    int reasoning_depth = 2;
    size_t certainty_shortfalls = 0;
    double last_certainty_gap = 0.0;
    std::set<std::string> optimized_patterns;
};

class RUSSELL_API EngineState {
public:
    explicit EngineState(const EngineConfig& config = EngineConfig{});

    // =========================================================================
    // Λ (monotonic)
    // =========================================================================

    double lambda_total() const { return lambda_total_; }

    /**
     * @brief Add a Λ impact and record the new total
     * @throws std::invalid_argument on negative or non-finite impact
     */
    void add_lambda(double impact);

    /**
     * @brief Λ_total after each reflect, starting with the initial value
     */
    const std::vector<double>& lambda_history() const { return lambda_history_; }

    // =========================================================================
    // Cycles and emergence (append-only)
    // =========================================================================

    const std::vector<ReflectionCycle>& cycles() const { return cycles_; }
    size_t cycles_completed() const { return cycles_.size(); }
    void append_cycle(ReflectionCycle cycle);

    const std::vector<double>& emergence_history() const { return emergence_history_; }
    void record_emergence(double emergence);

    /**
     * @brief Mean of the last `window` emergence samples; 0 with fewer samples
     */
    double rolling_emergence(size_t window) const;

    // =========================================================================
    // Reasoning cache
    // =========================================================================

    std::optional<ReasoningResult> cache_lookup(const std::string& key);
    void cache_store(const std::string& key, const ReasoningResult& result);
    void clear_cache();

    size_t cache_size() const { return cache_.size(); }
    size_t cache_hits() const { return cache_hits_; }
    size_t cache_misses() const { return cache_misses_; }
    double cache_hit_rate() const;

    // =========================================================================
    // Samples, tuning and improvement log
    // =========================================================================

    void record_certainty(double certainty) { certainty_samples_.push_back(certainty); }
    const std::vector<double>& certainty_samples() const { return certainty_samples_; }

    EngineTuning& tuning() { return tuning_; }
    const EngineTuning& tuning() const { return tuning_; }

    void log_improvement(ImprovementLogEntry entry);
    const std::vector<ImprovementLogEntry>& improvement_log() const { return improvement_log_; }
    size_t improvements_applied() const { return improvements_applied_; }
    size_t improvements_failed() const { return improvements_failed_; }

private:
    double lambda_total_;
    std::vector<double> lambda_history_;

    std::vector<ReflectionCycle> cycles_;
    std::vector<double> emergence_history_;

    std::unordered_map<std::string, ReasoningResult> cache_;
    std::deque<std::string> cache_order_;   // Insertion order for FIFO eviction
    size_t cache_capacity_;
    size_t cache_hits_ = 0;
    size_t cache_misses_ = 0;

    std::vector<double> certainty_samples_;

    EngineTuning tuning_;
    std::vector<ImprovementLogEntry> improvement_log_;
    size_t improvements_applied_ = 0;
    size_t improvements_failed_ = 0;
};

} // namespace Russell
