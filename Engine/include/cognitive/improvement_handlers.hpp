/**
 * @file improvement_handlers.hpp
 * @brief Remediation handlers for regenerative improvement proposals
 *
 * Proposals are plain data. Each ImprovementKind maps to one handler in a
 * static table; a handler mutates EngineState's tuning record and returns a
 * description of what it changed, or throws when the proposal cannot apply.
 */

#pragma once

#include <cognitive/engine_state.hpp>
#include <cognitive/reflection_types.hpp>
#include <export.hpp>
#include <string>

namespace Russell {

using ImprovementHandler = std::string (*)(const ImprovementProposal&, EngineState&);

/**
 * @brief Handler registered for a kind
 * @throws std::out_of_range for a kind outside the table
 */
RUSSELL_API ImprovementHandler handler_for(ImprovementKind kind);

/**
 * @brief Dispatch a proposal to its handler
 * @throws std::invalid_argument when the handler rejects the proposal
 */
RUSSELL_API std::string apply_improvement(const ImprovementProposal& proposal, EngineState& state);

} // namespace Russell
