/**
 * @file reasoning_engine.hpp
 * @brief Bounded recursive reasoning over a concept graph
 *
 *   EXTRACT:  ComponentExtractor → entities, relations, quantifiers, ...
 *   BASE:     known entities → inferences, unknown entities → unknowns,
 *             invalid relations + marker scan → contradictions,
 *             if/then, quantified and action structure → patterns
 *   REFINE:   hypotheses for unknowns, resolutions for contradictions,
 *             one-hop implications; unresolved unknowns recurse with budget − 1
 *   SCORE:    certainty and emergence (capped at 5.0)
 *
 * Results are memoized in EngineState under (query, context, depth).
 */

#pragma once

#include <cognitive/component_extractor.hpp>
#include <cognitive/concept_graph.hpp>
#include <cognitive/context.hpp>
#include <cognitive/engine_state.hpp>
#include <cognitive/reasoning_types.hpp>
#include <config/engine_config.hpp>
#include <export.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Russell {

class RUSSELL_API ReasoningEngine {
public:
    static constexpr double EMERGENCE_CAP = 5.0;

    /**
     * @param extractor Component extractor; lexical when null
     */
    ReasoningEngine(EngineState& state, const ReasoningConfig& config = ReasoningConfig{},
                    std::unique_ptr<ComponentExtractor> extractor = nullptr);

    /**
     * @brief Reason about a query to the requested depth
     *
     * Depth is clamped to [1, max_depth]. Never throws for domain conditions;
     * an exhausted budget shows up as a max_depth_reached refinement sentinel.
     */
    ReasoningResult reason_about(const std::string& query,
                                 const Context& context,
                                 int depth);

    /**
     * @brief reason_about at the configured default depth
     */
    ReasoningResult reason_about(const std::string& query,
                                 const Context& context = Context::object());

    int clamp_depth(int depth) const;

    // Concept graph
    ConceptGraph& concepts() { return graph_; }
    const ConceptGraph& concepts() const { return graph_; }
    void add_concept(const std::string& name) { graph_.add_concept(name); }
    void relate(const std::string& from, const std::string& to) { graph_.relate(from, to); }

    const ComponentExtractor& extractor() const { return *extractor_; }
    const ReasoningConfig& config() const { return config_; }

    ReasoningStats stats() const;

    /**
     * @brief clamp(0.7 − 0.1u − 0.2c + min(0.3, 0.05r) + 0.05p, [0.1, 1.0])
     */
    static double compute_certainty(size_t unknowns, size_t contradictions,
                                    size_t refinements, size_t patterns);

    /**
     * @brief log2(1 + unique) × (1 + 0.1 depth) × sqrt(max(1, patterns + direct)), capped at 5.0
     *
     * Zero when there are no unique insights. Only entity inferences count
     * as direct; valid relation tokens do not add complexity.
     */
    static double compute_emergence(size_t unique_insights, int depth,
                                    size_t patterns, size_t direct_inferences);

    /**
     * @brief True when the known relation vocabulary contains the token
     */
    static bool is_valid_relation(const std::string& relation);

private:
    ReasoningResult perform(const std::string& query, const Context& context, int depth) const;

    std::vector<ReasoningPattern> find_patterns(const QueryComponents& components) const;

    std::shared_ptr<const RefinementNode> refine(const std::vector<std::string>& unknowns,
                                                 const std::vector<std::string>& contradictions,
                                                 const std::vector<std::string>& known,
                                                 const Context& context,
                                                 int budget, int level) const;

    /**
     * @brief Label for an unknown that can be accounted for, if any
     */
    std::optional<std::string> resolve_unknown(const std::string& unknown,
                                               const Context& context) const;

    EngineState& state_;
    ReasoningConfig config_;
    std::unique_ptr<ComponentExtractor> extractor_;
    ConceptGraph graph_;

    size_t queries_processed_ = 0;
    size_t cache_hits_ = 0;
    long long depth_sum_ = 0;
    double total_time_ms_ = 0.0;
};

} // namespace Russell
