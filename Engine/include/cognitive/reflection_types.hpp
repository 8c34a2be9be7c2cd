/**
 * @file reflection_types.hpp
 * @brief Records produced by one R3 reflection cycle
 */

#pragma once

#include <cognitive/context.hpp>
#include <cognitive/reasoning_types.hpp>
#include <export.hpp>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace Russell {

// =============================================================================
// Levels and improvement kinds
// =============================================================================

enum class ReflectionLevel : int {
    Reflexive = 1,
    Recursive = 2,
    Regenerative = 3,
    Transcendent = 4
};

/**
 * @brief Execution order of a cycle; every level always runs
 */
inline constexpr std::array<ReflectionLevel, 4> kReflectionSequence = {
    ReflectionLevel::Reflexive,
    ReflectionLevel::Recursive,
    ReflectionLevel::Regenerative,
    ReflectionLevel::Transcendent
};

RUSSELL_API const char* to_string(ReflectionLevel level);

enum class ImprovementKind : size_t {
    IncreaseDepth = 0,
    ImproveCertainty = 1,
    OptimizePatterns = 2
};

inline constexpr size_t kImprovementKindCount = 3;

RUSSELL_API const char* to_string(ImprovementKind kind);

struct ImprovementProposal {
    ImprovementKind kind = ImprovementKind::IncreaseDepth;
    double current_value = 0.0;
    double target_value = 0.0;
    std::vector<std::string> patterns;   // OptimizePatterns only
    double impact = 0.0;                 // 0.3 / 0.2 / 0.15
};

// =============================================================================
// Per-level outcomes
// =============================================================================

struct ReflexiveOutcome {
    ReasoningResult analysis;       // The meta-query's reasoning
    Context analysis_context;       // Context the meta-query ran under
    std::vector<std::string> insights;
    double certainty = 0.0;
};

struct RecursiveOutcome {
    std::vector<std::string> thinking_patterns;
    std::vector<std::string> inefficient_patterns;
    std::vector<std::string> recursions;
    std::vector<std::string> fixed_points;
    int recursive_depth = 1;
    std::vector<std::string> insights;
    double certainty = 0.0;
};

struct RegenerativeOutcome {
    std::vector<ImprovementProposal> proposals;
    double potential_gain = 0.0;
    std::vector<std::string> insights;   // Always empty
    double certainty = 0.7;
};

struct Framework {
    std::string name;
    std::vector<std::string> principles;
    size_t source_proposals = 0;
};

struct TranscendentOutcome {
    bool breakthrough = false;
    double rolling_emergence = 0.0;
    std::optional<Framework> framework;
    std::vector<std::string> insights;
    double certainty = 0.0;
};

/**
 * @brief Insight strings and certainty of one level, as fed to the emergence formula
 */
struct LevelInsights {
    std::vector<std::string> insights;
    double certainty = 0.0;
};

// =============================================================================
// Cycle
// =============================================================================

struct RUSSELL_API ReflectionCycle {
    std::string id;
    size_t index = 0;
    std::string query;
    Context context;

    ReflectionLevel level_reached = ReflectionLevel::Regenerative;
    size_t levels_executed = 0;

    ReflexiveOutcome reflexive;
    RecursiveOutcome recursive;
    RegenerativeOutcome regenerative;
    TranscendentOutcome transcendent;

    double emergence = 0.0;
    double lambda_before = 0.0;
    double lambda_impact = 0.0;
    double lambda_after = 0.0;
    double duration_ms = 0.0;
    double timestamp = 0.0;
    std::string hash;

    std::vector<LevelInsights> levels() const;

    size_t improvement_count() const { return regenerative.proposals.size(); }

    /**
     * @brief Digest of id, level reached, per-level insights and proposals
     */
    std::string compute_hash() const;
};

struct CycleMetrics {
    double lambda_total = 0.0;
    double lambda_growth = 0.0;
    double emergence = 0.0;
    ReflectionLevel refinement_level = ReflectionLevel::Regenerative;
    size_t improvements_generated = 0;
    size_t improvements_applied = 0;
    size_t improvements_failed = 0;
    double duration_ms = 0.0;
};

struct ReflectionOutcome {
    ReflectionCycle cycle;
    CycleMetrics metrics;
};

struct ImprovementLogEntry {
    std::string cycle_id;
    ImprovementKind kind = ImprovementKind::IncreaseDepth;
    bool success = false;
    std::string result;
    std::string error;
    double timestamp = 0.0;
};

} // namespace Russell
