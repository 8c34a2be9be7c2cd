/**
 * @file record_json.cpp
 * @brief JSON conversion for engine records
 */

#include <serialization/record_json.hpp>
#include <stdexcept>

namespace Russell {

using json = nlohmann::json;

std::string dump_record(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

// =============================================================================
// Axioms and grounding
// =============================================================================

void to_json(json& j, const Axiom& axiom) {
    j = json{
        {"id", axiom.id},
        {"statement", axiom.statement},
        {"certainty", axiom.certainty},
        {"category", to_string(axiom.category)},
        {"description", axiom.description},
        {"allowed_transformations", axiom.allowed_transformations}
    };
}

void to_json(json& j, const ProofStep& step) {
    j = json{
        {"axiom_id", step.axiom_id},
        {"transformation", step.transformation},
        {"result", step.result},
        {"certainty", step.certainty}
    };
}

void to_json(json& j, const GroundedStatement& grounded) {
    j = json{
        {"statement", grounded.statement()},
        {"proof_steps", grounded.proof_steps()},
        {"certainty", grounded.certainty()},
        {"axioms_used", grounded.axioms_used()},
        {"fallback", grounded.is_fallback()},
        {"hash", grounded.hash()},
        {"created_at", grounded.created_at()}
    };
}

void to_json(json& j, const GroundingMetrics& metrics) {
    j = json{
        {"total_grounded", metrics.total_grounded},
        {"fallbacks", metrics.fallbacks},
        {"avg_certainty", metrics.avg_certainty},
        {"std_certainty", metrics.std_certainty},
        {"proof_registry_size", metrics.proof_registry_size},
        {"axioms_loaded", metrics.axioms_loaded}
    };
}

// =============================================================================
// Reasoning
// =============================================================================

void to_json(json& j, const QueryComponents& components) {
    j = json{
        {"entities", components.entities},
        {"relations", components.relations},
        {"quantifiers", components.quantifiers},
        {"modalities", components.modalities},
        {"actions", components.actions},
        {"connectives", components.connectives}
    };
}

void to_json(json& j, const Inference& inference) {
    j = json{
        {"kind", inference.kind},
        {"subject", inference.subject},
        {"related", inference.related}
    };
}

void to_json(json& j, const ReasoningPattern& pattern) {
    j = json{
        {"type", pattern.type},
        {"certainty", pattern.certainty},
        {"description", pattern.description}
    };
}

void to_json(json& j, const Refinement& refinement) {
    j = json{
        {"kind", to_string(refinement.kind)},
        {"subject", refinement.subject},
        {"content", refinement.content},
        {"certainty", refinement.certainty},
        {"resolved", refinement.resolved}
    };
}

void to_json(json& j, const RefinementNode& node) {
    j = json{
        {"level", node.level},
        {"budget", node.budget},
        {"max_depth_reached", node.max_depth_reached},
        {"refinements", node.refinements},
        {"novel_insights", node.novel_insights},
        {"carried_unknowns", node.carried_unknowns}
    };
    j["next"] = node.next ? json(*node.next) : json(nullptr);
}

void to_json(json& j, const ReasoningResult& result) {
    j = json{
        {"query", result.query},
        {"components", result.components},
        {"inferences", result.inferences},
        {"contradictions", result.contradictions},
        {"unknowns", result.unknowns},
        {"patterns", result.patterns},
        {"needs_refinement", result.needs_refinement},
        {"novel_insights", result.novel_insights},
        {"refinement_count", result.refinement_count()},
        {"max_depth_reached", result.max_depth_reached()},
        {"certainty", result.certainty},
        {"emergence", result.emergence},
        {"depth", result.depth_used},
        {"hash", result.hash},
        {"timestamp", result.timestamp}
    };
    j["refinement"] = result.refinement ? json(*result.refinement) : json(nullptr);
}

void to_json(json& j, const ReasoningStats& stats) {
    j = json{
        {"queries_processed", stats.queries_processed},
        {"cache_hits", stats.cache_hits},
        {"cache_hit_rate", stats.cache_hit_rate()},
        {"cache_size", stats.cache_size},
        {"concept_count", stats.concept_count},
        {"avg_depth", stats.avg_depth},
        {"avg_response_ms", stats.avg_response_ms()}
    };
}

// =============================================================================
// Reflection
// =============================================================================

ImprovementKind improvement_kind_from_string(const std::string& name) {
    for (size_t i = 0; i < kImprovementKindCount; ++i) {
        auto kind = static_cast<ImprovementKind>(i);
        if (name == to_string(kind)) return kind;
    }
    throw std::invalid_argument("Unknown improvement kind: " + name);
}

void to_json(json& j, const ImprovementProposal& proposal) {
    j = json{
        {"type", to_string(proposal.kind)},
        {"current", proposal.current_value},
        {"target", proposal.target_value},
        {"patterns", proposal.patterns},
        {"impact", proposal.impact}
    };
}

void from_json(const json& j, ImprovementProposal& proposal) {
    proposal.kind = improvement_kind_from_string(j.at("type").get<std::string>());
    proposal.current_value = j.value("current", 0.0);
    proposal.target_value = j.value("target", 0.0);
    proposal.patterns = j.value("patterns", std::vector<std::string>{});
    proposal.impact = j.value("impact", 0.0);
}

void to_json(json& j, const Framework& framework) {
    j = json{
        {"name", framework.name},
        {"principles", framework.principles},
        {"source_proposals", framework.source_proposals}
    };
}

void to_json(json& j, const ReflexiveOutcome& outcome) {
    j = json{
        {"level", to_string(ReflectionLevel::Reflexive)},
        {"analysis", outcome.analysis},
        {"insights", outcome.insights},
        {"certainty", outcome.certainty}
    };
}

void to_json(json& j, const RecursiveOutcome& outcome) {
    j = json{
        {"level", to_string(ReflectionLevel::Recursive)},
        {"thinking_patterns", outcome.thinking_patterns},
        {"inefficient_patterns", outcome.inefficient_patterns},
        {"recursions", outcome.recursions},
        {"recursive_depth", outcome.recursive_depth},
        {"fixed_points", outcome.fixed_points},
        {"insights", outcome.insights},
        {"certainty", outcome.certainty}
    };
}

void to_json(json& j, const RegenerativeOutcome& outcome) {
    j = json{
        {"level", to_string(ReflectionLevel::Regenerative)},
        {"improvements", outcome.proposals},
        {"potential_gain", outcome.potential_gain},
        {"insights", outcome.insights},
        {"certainty", outcome.certainty}
    };
}

void to_json(json& j, const TranscendentOutcome& outcome) {
    j = json{
        {"level", to_string(ReflectionLevel::Transcendent)},
        {"breakthrough", outcome.breakthrough},
        {"rolling_emergence", outcome.rolling_emergence},
        {"insights", outcome.insights},
        {"certainty", outcome.certainty}
    };
    j["framework"] = outcome.framework ? json(*outcome.framework) : json(nullptr);
}

void to_json(json& j, const ReflectionCycle& cycle) {
    j = json{
        {"id", cycle.id},
        {"index", cycle.index},
        {"level", to_string(cycle.level_reached)},
        {"levels_executed", cycle.levels_executed},
        {"input_state", {{"query", cycle.query}, {"context", cycle.context}}},
        {"reflections", json::array({cycle.reflexive, cycle.recursive,
                                     cycle.regenerative, cycle.transcendent})},
        {"improvements", cycle.regenerative.proposals},
        {"emergence", cycle.emergence},
        {"lambda_before", cycle.lambda_before},
        {"lambda_impact", cycle.lambda_impact},
        {"lambda_after", cycle.lambda_after},
        {"duration_ms", cycle.duration_ms},
        {"timestamp", cycle.timestamp},
        {"hash", cycle.hash}
    };
}

void to_json(json& j, const CycleMetrics& metrics) {
    j = json{
        {"lambda_total", metrics.lambda_total},
        {"lambda_growth", metrics.lambda_growth},
        {"emergence", metrics.emergence},
        {"refinement_level", static_cast<int>(metrics.refinement_level)},
        {"improvements_generated", metrics.improvements_generated},
        {"improvements_applied", metrics.improvements_applied},
        {"improvements_failed", metrics.improvements_failed},
        {"duration_ms", metrics.duration_ms}
    };
}

void to_json(json& j, const ReflectionOutcome& outcome) {
    j = json{
        {"cycle", outcome.cycle},
        {"metrics", outcome.metrics}
    };
}

void to_json(json& j, const ImprovementLogEntry& entry) {
    j = json{
        {"cycle_id", entry.cycle_id},
        {"improvement", to_string(entry.kind)},
        {"success", entry.success},
        {"timestamp", entry.timestamp}
    };
    if (entry.success) j["result"] = entry.result;
    else j["error"] = entry.error;
}

// =============================================================================
// Pipeline
// =============================================================================

void to_json(json& j, const ConvergenceReport& report) {
    j = json{
        {"converged", report.converged},
        {"confidence", report.confidence},
        {"avg_change", report.avg_change},
        {"std_change", report.std_change},
        {"trend", report.trend},
        {"samples", report.samples}
    };
}

void to_json(json& j, const SafetyChecks& checks) {
    j = json{
        {"logical_consistency", checks.logical_consistency},
        {"no_contradictions", checks.no_contradictions},
        {"ethical_alignment", checks.ethical_alignment},
        {"system_stability", checks.system_stability},
        {"all_passed", checks.all_passed()}
    };
}

void to_json(json& j, const RequirementsReport& report) {
    json checks = json::object();
    for (const auto& c : report.checks) checks[c.name] = c.met;
    j = json{
        {"requirements", checks},
        {"all_met", report.all_met()},
        {"score", report.score()}
    };
}

void to_json(json& j, const ReasoningPath& path) {
    j = json{
        {"id", path.id},
        {"query", path.query},
        {"grounding", {
            {"hash", path.grounding_hash},
            {"certainty", path.grounding_certainty},
            {"axioms_used", path.axioms_used},
            {"fallback", path.grounding_fallback}
        }},
        {"reasoning", path.reasoning},
        {"cycle", path.cycle},
        {"reasoning_depth", path.reasoning_depth},
        {"emergence", path.emergence},
        {"lambda_impact", path.lambda_impact},
        {"safety", path.safety},
        {"convergence", path.convergence},
        {"requirements", path.requirements},
        {"timestamp", path.timestamp},
        {"hash", path.hash},
        {"persisted", path.persisted}
    };
}

void to_json(json& j, const EngineMetrics& metrics) {
    j = json{
        {"avg_certainty", metrics.avg_certainty},
        {"avg_emergence", metrics.avg_emergence},
        {"cache_hit_rate", metrics.cache_hit_rate},
        {"lambda_total", metrics.lambda_total},
        {"convergence", metrics.convergence},
        {"avg_grounding_certainty", metrics.avg_grounding_certainty},
        {"avg_reasoning_depth", metrics.avg_reasoning_depth},
        {"queries_processed", metrics.queries_processed},
        {"cycles_completed", metrics.cycles_completed},
        {"paths_stored", metrics.paths_stored},
        {"cache_size", metrics.cache_size},
        {"improvements_applied", metrics.improvements_applied},
        {"improvements_failed", metrics.improvements_failed},
        {"reasoning_depth", metrics.reasoning_depth},
        {"requirements", metrics.requirements}
    };
}

} // namespace Russell
