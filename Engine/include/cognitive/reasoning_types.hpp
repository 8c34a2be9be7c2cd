/**
 * @file reasoning_types.hpp
 * @brief Records produced by ReasoningEngine
 */

#pragma once

#include <cognitive/component_extractor.hpp>
#include <export.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Russell {

struct Inference {
    std::string kind;                  // "entity_known" | "relation_valid"
    std::string subject;
    std::vector<std::string> related;  // Graph neighbours for known entities
};

struct ReasoningPattern {
    std::string type;                  // implication | quantified | action
    double certainty;                  // 0.8 / 0.7 / 0.6
    std::string description;
};

enum class RefinementKind {
    Hypothesis,   // About an unknown entity
    Resolution,   // Of a contradiction
    Implication   // One-hop graph traversal from a known entity
};

RUSSELL_API const char* to_string(RefinementKind kind);

struct Refinement {
    RefinementKind kind;
    std::string subject;
    std::string content;
    double certainty;
    bool resolved;
};

/**
 * @brief One refinement pass; `next` continues with the unknowns it could not resolve
 *
 * A pass entered with no depth budget left is the max_depth_reached sentinel:
 * it carries the outstanding unknowns and no refinements.
 */
struct RUSSELL_API RefinementNode {
    int level = 1;                           // 1 = first refinement pass
    int budget = 0;                          // Depth budget on entry
    bool max_depth_reached = false;
    std::vector<Refinement> refinements;
    std::vector<std::string> novel_insights; // Distinct contents within this pass
    std::vector<std::string> carried_unknowns;
    std::shared_ptr<const RefinementNode> next;

    size_t total_refinements() const;

    /**
     * @brief Number of passes including a terminal sentinel
     */
    size_t chain_length() const;

    const RefinementNode& deepest() const;
    bool reached_max_depth() const { return deepest().max_depth_reached; }
};

/**
 * @brief Output of reason_about; immutable once produced or cached
 */
struct RUSSELL_API ReasoningResult {
    std::string query;
    QueryComponents components;

    std::vector<Inference> inferences;
    std::vector<std::string> contradictions;
    std::vector<std::string> unknowns;
    std::vector<ReasoningPattern> patterns;
    bool needs_refinement = false;

    std::shared_ptr<const RefinementNode> refinement;  // null when not entered
    std::vector<std::string> novel_insights;           // Distinct across the whole tree

    double certainty = 0.0;   // [0.1, 1.0]
    double emergence = 0.0;   // [0, 5.0]
    int depth_used = 0;
    std::string hash;
    double timestamp = 0.0;   // Wall clock; not hashed

    size_t refinement_count() const { return refinement ? refinement->total_refinements() : 0; }
    bool max_depth_reached() const { return refinement && refinement->reached_max_depth(); }

    /// Inferences drawn from known entities; relation checks are excluded
    size_t direct_inference_count() const;

    /**
     * @brief Digest over every field except the timestamp
     */
    std::string compute_hash() const;
};

struct ReasoningStats {
    size_t queries_processed = 0;   // Computed (cache misses)
    size_t cache_hits = 0;
    size_t cache_size = 0;
    size_t concept_count = 0;
    double avg_depth = 0.0;
    double total_time_ms = 0.0;

    double cache_hit_rate() const {
        size_t lookups = queries_processed + cache_hits;
        return lookups ? static_cast<double>(cache_hits) / static_cast<double>(lookups) : 0.0;
    }

    double avg_response_ms() const {
        return queries_processed ? total_time_ms / static_cast<double>(queries_processed) : 0.0;
    }
};

} // namespace Russell
