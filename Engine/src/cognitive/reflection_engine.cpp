/**
 * @file reflection_engine.cpp
 * @brief The four-level R3 cycle, cycle emergence and Λ accounting
 */

#include <cognitive/reflection_engine.hpp>
#include <cognitive/improvement_handlers.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_set>

namespace Russell {

ReflectionEngine::ReflectionEngine(ReasoningEngine& reasoning, EngineState& state,
                                   const ReflectionConfig& config)
    : reasoning_(reasoning), state_(state), config_(config) {}

// =============================================================================
// Cycle
// =============================================================================

ReflectionOutcome ReflectionEngine::reflect(const std::string& query, const Context& context) {
    Timer timer;

    ReflectionCycle cycle;
    cycle.index = state_.cycles_completed();
    cycle.query = query;
    cycle.context = context.is_null() ? Context::object() : context;
    cycle.timestamp = Timer::unix_seconds();
    cycle.id = "r3_" + std::to_string(cycle.index) + "_" +
               std::to_string(static_cast<long long>(cycle.timestamp));

    for (ReflectionLevel level : kReflectionSequence) {
        switch (level) {
            case ReflectionLevel::Reflexive:
                cycle.reflexive = reflexive_level(query, cycle.context);
                break;
            case ReflectionLevel::Recursive:
                cycle.recursive = recursive_level(cycle.reflexive);
                break;
            case ReflectionLevel::Regenerative:
                cycle.regenerative = regenerative_level(cycle.recursive);
                break;
            case ReflectionLevel::Transcendent:
                cycle.transcendent = transcendent_level(cycle.regenerative, cycle.index);
                break;
        }
        ++cycle.levels_executed;
    }

    cycle.level_reached = cycle.transcendent.breakthrough
        ? ReflectionLevel::Transcendent
        : ReflectionLevel::Regenerative;

    cycle.emergence = compute_emergence(cycle.levels());
    cycle.lambda_impact = lambda_impact(cycle.emergence, cycle.index);
    cycle.lambda_before = state_.lambda_total();
    state_.add_lambda(cycle.lambda_impact);
    cycle.lambda_after = state_.lambda_total();
    state_.record_emergence(cycle.emergence);

    cycle.duration_ms = timer.elapsed_ms();
    cycle.hash = cycle.compute_hash();
    state_.append_cycle(cycle);

    auto [applied, failed] = apply_improvements(cycle);

    ReflectionOutcome outcome;
    outcome.metrics.lambda_total = state_.lambda_total();
    outcome.metrics.lambda_growth = cycle.lambda_after - cycle.lambda_before;
    outcome.metrics.emergence = cycle.emergence;
    outcome.metrics.refinement_level = cycle.level_reached;
    outcome.metrics.improvements_generated = cycle.improvement_count();
    outcome.metrics.improvements_applied = applied;
    outcome.metrics.improvements_failed = failed;
    outcome.metrics.duration_ms = cycle.duration_ms;

    Logger::info("R3 cycle " + cycle.id + " (" + to_string(cycle.level_reached) + ")" +
                 " emergence=" + text::fixed(cycle.emergence, 3) +
                 " lambda=" + text::fixed(cycle.lambda_after, 4) +
                 " (+" + text::fixed(cycle.lambda_impact, 4) + ")");

    outcome.cycle = std::move(cycle);
    return outcome;
}

// =============================================================================
// Level 1: Reflexive (what am I doing?)
// =============================================================================

ReflexiveOutcome ReflectionEngine::reflexive_level(const std::string& query, const Context& context) {
    ReflexiveOutcome out;

    out.analysis_context = context.is_object() ? context : Context::object();
    out.analysis_context["analysis_type"] = "self_analysis";
    out.analysis = reasoning_.reason_about(META_QUERY_PREFIX + query, out.analysis_context, 1);

    out.insights = {
        "Processing query: " + query,
        "Context: " + normalize_context(context),
        "Current state: lambda=" + text::fixed(state_.lambda_total(), 4) +
            " cycles=" + std::to_string(state_.cycles_completed()) +
            " cache=" + std::to_string(state_.cache_size())
    };
    out.certainty = out.analysis.certainty;
    return out;
}

// =============================================================================
// Level 2: Recursive (how am I thinking about it?)
// =============================================================================

RecursiveOutcome ReflectionEngine::recursive_level(const ReflexiveOutcome& reflexive) {
    RecursiveOutcome out;
    const ReasoningResult& analysis = reflexive.analysis;

    // Thinking patterns
    for (const auto& p : analysis.patterns) out.thinking_patterns.push_back(p.type);
    if (!analysis.unknowns.empty()) out.thinking_patterns.push_back("hypothesis_formation");
    if (!analysis.contradictions.empty()) out.thinking_patterns.push_back("contradiction_resolution");
    if (analysis.refinement) out.thinking_patterns.push_back("recursive_refinement");
    if (!analysis.inferences.empty()) out.thinking_patterns.push_back("direct_inference");

    if (analysis.patterns.empty()) {
        out.certainty = 0.6;
    } else {
        double sum = std::accumulate(analysis.patterns.begin(), analysis.patterns.end(), 0.0,
            [](double acc, const ReasoningPattern& p) { return acc + p.certainty; });
        out.certainty = sum / static_cast<double>(analysis.patterns.size());
    }

    // Inefficiencies
    const std::vector<std::string>& outstanding = analysis.refinement
        ? analysis.refinement->deepest().carried_unknowns
        : analysis.unknowns;
    if (!outstanding.empty()) out.inefficient_patterns.push_back("unresolved_unknowns");
    if (!analysis.contradictions.empty() && !analysis.refinement) {
        out.inefficient_patterns.push_back("unresolved_contradictions");
    }
    if (analysis.refinement_count() > analysis.novel_insights.size()) {
        out.inefficient_patterns.push_back("redundant_refinement");
    }

    // Recursive structure
    for (const RefinementNode* node = analysis.refinement.get(); node; node = node->next.get()) {
        out.recursions.push_back("level " + std::to_string(node->level) + ": " +
                                 std::to_string(node->refinements.size()) + " refinements" +
                                 (node->max_depth_reached ? " (max depth)" : ""));
    }
    out.recursive_depth = 1 + static_cast<int>(analysis.refinement ? analysis.refinement->chain_length() : 0);

    // Fixed points: what one more refinement pass leaves unchanged
    ReasoningResult probe = reasoning_.reason_about(analysis.query, reflexive.analysis_context,
                                                    analysis.depth_used + 1);
    for (const auto& p : analysis.patterns) {
        bool stable = std::any_of(probe.patterns.begin(), probe.patterns.end(),
            [&](const ReasoningPattern& q) { return q.type == p.type; });
        if (stable) out.fixed_points.push_back("pattern:" + p.type);
    }
    const std::vector<std::string>& probe_outstanding = probe.refinement
        ? probe.refinement->deepest().carried_unknowns
        : probe.unknowns;
    for (const auto& unknown : analysis.unknowns) {
        if (std::find(probe_outstanding.begin(), probe_outstanding.end(), unknown) !=
            probe_outstanding.end()) {
            out.fixed_points.push_back("unknown:" + unknown);
        }
    }

    out.insights = {
        "Thinking patterns: [" + text::join(out.thinking_patterns, ", ") + "]",
        "Recursive depth: " + std::to_string(out.recursive_depth),
        "Fixed points found: " + std::to_string(out.fixed_points.size())
    };
    return out;
}

// =============================================================================
// Level 3: Regenerative (how can I improve?)
// =============================================================================

RegenerativeOutcome ReflectionEngine::regenerative_level(const RecursiveOutcome& recursive) const {
    RegenerativeOutcome out;

    int current_depth = state_.tuning().reasoning_depth;
    ImprovementProposal depth;
    depth.kind = ImprovementKind::IncreaseDepth;
    depth.current_value = current_depth;
    depth.target_value = std::min(config_.max_reasoning_depth, current_depth + 1);
    depth.impact = 0.15;
    out.proposals.push_back(depth);

    if (recursive.certainty < config_.certainty_threshold) {
        ImprovementProposal certainty;
        certainty.kind = ImprovementKind::ImproveCertainty;
        certainty.current_value = recursive.certainty;
        certainty.target_value = config_.certainty_threshold;
        certainty.impact = 0.1;
        out.proposals.push_back(certainty);
    }

    if (!recursive.inefficient_patterns.empty()) {
        ImprovementProposal patterns;
        patterns.kind = ImprovementKind::OptimizePatterns;
        patterns.patterns = recursive.inefficient_patterns;
        patterns.impact = 0.2;
        out.proposals.push_back(patterns);
    }

    for (const auto& p : out.proposals) out.potential_gain += p.impact;
    out.certainty = 0.7;
    return out;
}

// =============================================================================
// Level 4: Transcendent (new frameworks?)
// =============================================================================

TranscendentOutcome ReflectionEngine::transcendent_level(const RegenerativeOutcome& regenerative,
                                                         size_t cycle_index) const {
    TranscendentOutcome out;
    out.rolling_emergence = state_.rolling_emergence(config_.rolling_window);

    std::string mean = text::fixed(out.rolling_emergence, 2);
    std::string target = text::fixed(config_.emergence_target, 2);

    if (out.rolling_emergence >= config_.emergence_target) {
        Framework framework;
        for (const auto& p : regenerative.proposals) {
            framework.principles.push_back(to_string(p.kind));
        }
        framework.source_proposals = regenerative.proposals.size();
        framework.name = "framework_" + std::to_string(cycle_index) + "_" +
            BLAKE3Pipeline::hash_hex(text::join(framework.principles, "|")).substr(0, 8);

        out.breakthrough = true;
        out.insights = {
            "New framework created: " + framework.name,
            "Emergence threshold met: " + mean + " >= " + target,
            "Transcendent capability achieved"
        };
        out.certainty = 0.8;
        out.framework = std::move(framework);
    } else {
        out.breakthrough = false;
        out.insights = {
            "Emergence insufficient: " + mean + " < " + target,
            "Continue recursive refinement"
        };
        out.certainty = 0.5;
    }
    return out;
}

// =============================================================================
// Scoring
// =============================================================================

double ReflectionEngine::compute_emergence(const std::vector<LevelInsights>& levels) {
    std::unordered_set<BLAKE3Pipeline::Hash, HashHasher> novel;
    size_t depth_factor = 0;
    size_t complexity = 0;

    for (const auto& level : levels) {
        for (const auto& insight : level.insights) {
            std::string lower = text::to_lower(insight);
            if (lower.find("new") != std::string::npos || lower.find("create") != std::string::npos) {
                novel.insert(BLAKE3Pipeline::hash(insight));
            }
        }
        if (level.certainty > 0.7) ++depth_factor;
        complexity += level.insights.size();
    }

    if (novel.empty()) return 0.0;
    return std::log2(1.0 + static_cast<double>(novel.size()))
         * static_cast<double>(depth_factor)
         * std::sqrt(static_cast<double>(complexity));
}

double ReflectionEngine::emergence_multiplier(double emergence) {
    if (emergence >= 2.0) return 1.5;
    if (emergence >= 1.0) return 1.2;
    return 0.8;
}

double ReflectionEngine::lambda_impact(double emergence, size_t cycles_completed) const {
    double depth_multiplier = 1.0 + 0.05 * static_cast<double>(cycles_completed);
    return config_.base_growth * emergence_multiplier(emergence) * depth_multiplier;
}

// =============================================================================
// Improvements
// =============================================================================

std::pair<size_t, size_t> ReflectionEngine::apply_improvements(const ReflectionCycle& cycle) {
    size_t applied = 0;
    size_t failed = 0;

    for (const auto& proposal : cycle.regenerative.proposals) {
        ImprovementLogEntry entry;
        entry.cycle_id = cycle.id;
        entry.kind = proposal.kind;
        entry.timestamp = Timer::unix_seconds();

        try {
            entry.result = apply_improvement(proposal, state_);
            entry.success = true;
            ++applied;
            Logger::debug(std::string("Improvement ") + to_string(proposal.kind) + ": " + entry.result);
        } catch (const std::exception& e) {
            entry.error = e.what();
            ++failed;
            Logger::warn(std::string("Improvement ") + to_string(proposal.kind) +
                         " failed: " + entry.error);
        }
        state_.log_improvement(std::move(entry));
    }
    return {applied, failed};
}

} // namespace Russell
