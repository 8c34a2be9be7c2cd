/**
 * @file record_json.hpp
 * @brief nlohmann::json representation of every engine record
 *
 * Records become trees of scalars, arrays and string-keyed objects, the
 * form handed to persistence sinks, the C API and the CLI.
 * Only improvement proposals parse back (from_json); they are pure data.
 */

#pragma once

#include <axioms/axiom_grounder.hpp>
#include <axioms/axiom_table.hpp>
#include <cognitive/cognitive_core.hpp>
#include <cognitive/reasoning_path.hpp>
#include <cognitive/reasoning_types.hpp>
#include <cognitive/reflection_types.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace Russell {

// Axioms and grounding
RUSSELL_API void to_json(nlohmann::json& j, const Axiom& axiom);
RUSSELL_API void to_json(nlohmann::json& j, const ProofStep& step);
RUSSELL_API void to_json(nlohmann::json& j, const GroundedStatement& grounded);
RUSSELL_API void to_json(nlohmann::json& j, const GroundingMetrics& metrics);

// Reasoning
RUSSELL_API void to_json(nlohmann::json& j, const QueryComponents& components);
RUSSELL_API void to_json(nlohmann::json& j, const Inference& inference);
RUSSELL_API void to_json(nlohmann::json& j, const ReasoningPattern& pattern);
RUSSELL_API void to_json(nlohmann::json& j, const Refinement& refinement);
RUSSELL_API void to_json(nlohmann::json& j, const RefinementNode& node);
RUSSELL_API void to_json(nlohmann::json& j, const ReasoningResult& result);
RUSSELL_API void to_json(nlohmann::json& j, const ReasoningStats& stats);

// Reflection
RUSSELL_API void to_json(nlohmann::json& j, const ImprovementProposal& proposal);
RUSSELL_API void from_json(const nlohmann::json& j, ImprovementProposal& proposal);
RUSSELL_API void to_json(nlohmann::json& j, const Framework& framework);
RUSSELL_API void to_json(nlohmann::json& j, const ReflexiveOutcome& outcome);
RUSSELL_API void to_json(nlohmann::json& j, const RecursiveOutcome& outcome);
RUSSELL_API void to_json(nlohmann::json& j, const RegenerativeOutcome& outcome);
RUSSELL_API void to_json(nlohmann::json& j, const TranscendentOutcome& outcome);
RUSSELL_API void to_json(nlohmann::json& j, const ReflectionCycle& cycle);
RUSSELL_API void to_json(nlohmann::json& j, const CycleMetrics& metrics);
RUSSELL_API void to_json(nlohmann::json& j, const ReflectionOutcome& outcome);
RUSSELL_API void to_json(nlohmann::json& j, const ImprovementLogEntry& entry);

// Pipeline
RUSSELL_API void to_json(nlohmann::json& j, const ConvergenceReport& report);
RUSSELL_API void to_json(nlohmann::json& j, const SafetyChecks& checks);
RUSSELL_API void to_json(nlohmann::json& j, const RequirementsReport& report);
RUSSELL_API void to_json(nlohmann::json& j, const ReasoningPath& path);
RUSSELL_API void to_json(nlohmann::json& j, const EngineMetrics& metrics);

/**
 * @brief Serialize a record; invalid UTF-8 in user text becomes U+FFFD
 */
RUSSELL_API std::string dump_record(const nlohmann::json& j, int indent = -1);

/**
 * @brief Parse an improvement kind name ("increase_reasoning_depth", ...)
 * @throws std::invalid_argument for unknown names
 */
RUSSELL_API ImprovementKind improvement_kind_from_string(const std::string& name);

} // namespace Russell
