/**
 * @file reasoning_engine.cpp
 * @brief Component extraction, base reasoning, recursive refinement and scoring
 */

#include <cognitive/reasoning_engine.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace Russell {

namespace {

const std::unordered_set<std::string> kKnownRelations = {
    "is", "are", "was", "were", "has", "have", "can", "does",
    "will", "should", "must", "implies", "equals"
};

const std::vector<std::string>& contradiction_markers() {
    static const std::vector<std::string> markers = {
        "not and", "and not", "but not", "however not",
        "false true", "true false", "yes no", "no yes"
    };
    return markers;
}

/**
 * @brief Keep first occurrences of refinement contents, compared by digest
 */
void collect_novel(const std::vector<Refinement>& refinements,
                   std::unordered_set<BLAKE3Pipeline::Hash, HashHasher>& seen,
                   std::vector<std::string>& out) {
    for (const auto& r : refinements) {
        if (seen.insert(BLAKE3Pipeline::hash(r.content)).second) {
            out.push_back(r.content);
        }
    }
}

} // namespace

ReasoningEngine::ReasoningEngine(EngineState& state, const ReasoningConfig& config,
                                 std::unique_ptr<ComponentExtractor> extractor)
    : state_(state),
      config_(config),
      extractor_(extractor ? std::move(extractor) : std::make_unique<LexicalComponentExtractor>()),
      graph_(ConceptGraph::with_logical_operators()) {
    if (config_.max_depth < 1) {
        throw std::invalid_argument("ReasoningConfig.max_depth must be at least 1");
    }
}

int ReasoningEngine::clamp_depth(int depth) const {
    return std::clamp(depth, 1, config_.max_depth);
}

bool ReasoningEngine::is_valid_relation(const std::string& relation) {
    return kKnownRelations.count(text::to_lower(relation)) > 0;
}

// =============================================================================
// Entry points
// =============================================================================

ReasoningResult ReasoningEngine::reason_about(const std::string& query, const Context& context) {
    return reason_about(query, context, config_.default_depth);
}

ReasoningResult ReasoningEngine::reason_about(const std::string& query,
                                              const Context& context,
                                              int depth) {
    int effective = clamp_depth(depth);
    if (effective != depth) {
        Logger::debug("Reasoning depth " + std::to_string(depth) + " clamped to " +
                      std::to_string(effective));
    }

    std::string key = make_cache_key(query, context, effective);
    if (auto cached = state_.cache_lookup(key)) {
        ++cache_hits_;
        Logger::debug("Reasoning cache hit: " + normalize_query(query));
        return *cached;
    }

    Timer timer;
    ReasoningResult result = perform(normalize_query(query), context, effective);
    double elapsed = timer.elapsed_ms();

    ++queries_processed_;
    depth_sum_ += effective;
    total_time_ms_ += elapsed;

    state_.cache_store(key, result);
    Logger::debug("Reasoned '" + result.query + "' depth=" + std::to_string(effective) +
                  " certainty=" + text::fixed(result.certainty, 3) +
                  " emergence=" + text::fixed(result.emergence, 3));
    return result;
}

ReasoningStats ReasoningEngine::stats() const {
    ReasoningStats s;
    s.queries_processed = queries_processed_;
    s.cache_hits = cache_hits_;
    s.cache_size = state_.cache_size();
    s.concept_count = graph_.size();
    s.avg_depth = queries_processed_
        ? static_cast<double>(depth_sum_) / static_cast<double>(queries_processed_)
        : 0.0;
    s.total_time_ms = total_time_ms_;
    return s;
}

// =============================================================================
// Base reasoning
// =============================================================================

ReasoningResult ReasoningEngine::perform(const std::string& query,
                                         const Context& context,
                                         int depth) const {
    ReasoningResult result;
    result.query = query;
    result.depth_used = depth;
    result.components = extractor_->extract(query);

    const auto& comp = result.components;
    std::vector<std::string> known;

    for (const auto& entity : comp.entities) {
        if (graph_.contains(entity)) {
            result.inferences.push_back({"entity_known", entity, graph_.neighbors(entity)});
            known.push_back(entity);
        } else {
            result.unknowns.push_back(entity);
        }
    }

    for (const auto& relation : comp.relations) {
        if (is_valid_relation(relation)) {
            result.inferences.push_back({"relation_valid", relation, {}});
        } else {
            result.contradictions.push_back("Invalid relation: " + relation);
        }
    }

    std::string flattened = comp.flatten();
    for (const auto& marker : contradiction_markers()) {
        if (flattened.find(marker) != std::string::npos) {
            result.contradictions.push_back("Contradiction marker: " + marker);
        }
    }

    result.patterns = find_patterns(comp);
    result.needs_refinement = !result.unknowns.empty() ||
                              !result.contradictions.empty() ||
                              result.patterns.empty();

    // Budget = depth − 1: the base pass itself consumes one level
    int budget = depth - 1;
    if (result.needs_refinement && budget > 0) {
        result.refinement = refine(result.unknowns, result.contradictions, known,
                                   context, budget, 1);

        std::unordered_set<BLAKE3Pipeline::Hash, HashHasher> seen;
        for (const RefinementNode* node = result.refinement.get(); node; node = node->next.get()) {
            collect_novel(node->refinements, seen, result.novel_insights);
        }
    }

    result.certainty = compute_certainty(result.unknowns.size(),
                                         result.contradictions.size(),
                                         result.refinement_count(),
                                         result.patterns.size());
    result.emergence = compute_emergence(result.novel_insights.size(), depth,
                                         result.patterns.size(),
                                         result.direct_inference_count());
    result.hash = result.compute_hash();
    result.timestamp = Timer::unix_seconds();
    return result;
}

std::vector<ReasoningPattern> ReasoningEngine::find_patterns(const QueryComponents& comp) const {
    std::vector<ReasoningPattern> patterns;

    if (comp.has_connective("if") && comp.has_connective("then")) {
        patterns.push_back({"implication", 0.8, "Conditional if/then structure"});
    }
    if (!comp.quantifiers.empty()) {
        patterns.push_back({"quantified", 0.7,
                            "Quantified statement (" + text::join(comp.quantifiers, ", ") + ")"});
    }
    if (!comp.actions.empty()) {
        patterns.push_back({"action", 0.6,
                            "Action-oriented statement (" + text::join(comp.actions, ", ") + ")"});
    }
    return patterns;
}

// =============================================================================
// Recursive refinement
// =============================================================================

std::optional<std::string> ReasoningEngine::resolve_unknown(const std::string& unknown,
                                                            const Context& context) const {
    if (LexicalComponentExtractor::is_pronoun(unknown)) {
        return "deictic reference";
    }
    if (auto match = graph_.find_case_insensitive(unknown)) {
        return *match;
    }
    if (context.is_object()) {
        if (context.contains(unknown)) {
            return "context key '" + unknown + "'";
        }
        auto it = context.find("known_entities");
        if (it != context.end() && it->is_array()) {
            for (const auto& item : *it) {
                if (item.is_string() && item.get<std::string>() == unknown) {
                    return "context entity '" + unknown + "'";
                }
            }
        }
    }
    return std::nullopt;
}

std::shared_ptr<const RefinementNode> ReasoningEngine::refine(
    const std::vector<std::string>& unknowns,
    const std::vector<std::string>& contradictions,
    const std::vector<std::string>& known,
    const Context& context,
    int budget, int level) const
{
    auto node = std::make_shared<RefinementNode>();
    node->level = level;
    node->budget = budget;

    if (budget <= 0) {
        node->max_depth_reached = true;
        node->carried_unknowns = unknowns;
        Logger::debug("Refinement depth budget exhausted at level " + std::to_string(level) +
                      " with " + std::to_string(unknowns.size()) + " unknowns outstanding");
        return node;
    }

    std::vector<std::string> sources = known;

    for (const auto& unknown : unknowns) {
        auto resolution = resolve_unknown(unknown, context);
        if (resolution) {
            node->refinements.push_back({RefinementKind::Hypothesis, unknown,
                                         "Hypothesis: '" + unknown + "' resolves to " + *resolution,
                                         0.7, true});
            if (graph_.contains(*resolution)) sources.push_back(*resolution);
        } else {
            node->refinements.push_back({RefinementKind::Hypothesis, unknown,
                                         "Hypothesis: '" + unknown + "' is outside the concept graph",
                                         0.5, false});
            node->carried_unknowns.push_back(unknown);
        }
    }

    for (const auto& contradiction : contradictions) {
        node->refinements.push_back({RefinementKind::Resolution, contradiction,
                                     "Resolution: " + contradiction +
                                     " reconciled under non-contradiction",
                                     0.6, true});
    }

    size_t implications = 0;
    std::unordered_set<std::string> visited;
    for (const auto& source : sources) {
        if (!visited.insert(source).second) continue;
        for (const auto& neighbor : graph_.neighbors(source)) {
            if (implications >= config_.max_implications) break;
            node->refinements.push_back({RefinementKind::Implication, source,
                                         "Implication: " + source + " -> " + neighbor,
                                         0.7, true});
            ++implications;
        }
    }

    std::unordered_set<BLAKE3Pipeline::Hash, HashHasher> seen;
    collect_novel(node->refinements, seen, node->novel_insights);

    if (!node->carried_unknowns.empty()) {
        node->next = refine(node->carried_unknowns, {}, {}, context, budget - 1, level + 1);
    }
    return node;
}

// =============================================================================
// Scoring
// =============================================================================

double ReasoningEngine::compute_certainty(size_t unknowns, size_t contradictions,
                                          size_t refinements, size_t patterns) {
    double certainty = 0.7
        - 0.1 * static_cast<double>(unknowns)
        - 0.2 * static_cast<double>(contradictions)
        + std::min(0.3, 0.05 * static_cast<double>(refinements))
        + 0.05 * static_cast<double>(patterns);
    return std::clamp(certainty, 0.1, 1.0);
}

double ReasoningEngine::compute_emergence(size_t unique_insights, int depth,
                                          size_t patterns, size_t direct_inferences) {
    if (unique_insights == 0) return 0.0;

    double depth_factor = 1.0 + 0.1 * static_cast<double>(depth);
    // Floor of 1 so an insight with no patterns still scores
    double complexity = static_cast<double>(std::max<size_t>(1, patterns + direct_inferences));
    double emergence = std::log2(1.0 + static_cast<double>(unique_insights))
                     * depth_factor * std::sqrt(complexity);
    return std::min(emergence, EMERGENCE_CAP);
}

} // namespace Russell
