#include <cognitive/reflection_types.hpp>
#include <hashing/blake3_pipeline.hpp>

namespace Russell {

const char* to_string(ReflectionLevel level) {
    switch (level) {
        case ReflectionLevel::Reflexive:    return "reflexive";
        case ReflectionLevel::Recursive:    return "recursive";
        case ReflectionLevel::Regenerative: return "regenerative";
        case ReflectionLevel::Transcendent: return "transcendent";
    }
    return "unknown";
}

const char* to_string(ImprovementKind kind) {
    switch (kind) {
        case ImprovementKind::IncreaseDepth:    return "increase_reasoning_depth";
        case ImprovementKind::ImproveCertainty: return "improve_certainty";
        case ImprovementKind::OptimizePatterns: return "optimize_patterns";
    }
    return "unknown";
}

std::vector<LevelInsights> ReflectionCycle::levels() const {
    return {
        {reflexive.insights, reflexive.certainty},
        {recursive.insights, recursive.certainty},
        {regenerative.insights, regenerative.certainty},
        {transcendent.insights, transcendent.certainty},
    };
}

std::string ReflectionCycle::compute_hash() const {
    BLAKE3Pipeline::Incremental h;
    h.field(id)
     .field(static_cast<int64_t>(level_reached))
     .field(static_cast<int64_t>(levels_executed))
     .field(static_cast<int64_t>(improvement_count()));

    for (const auto& level : levels()) {
        h.field(static_cast<int64_t>(level.insights.size()));
        for (const auto& insight : level.insights) h.field(insight);
        h.field(level.certainty);
    }

    h.field(static_cast<int64_t>(regenerative.proposals.size()));
    for (const auto& p : regenerative.proposals) {
        h.field(to_string(p.kind)).field(p.current_value).field(p.target_value).field(p.impact);
        for (const auto& pattern : p.patterns) h.field(pattern);
    }

    h.field(emergence).field(lambda_impact);
    return h.finalize_hex();
}

} // namespace Russell
