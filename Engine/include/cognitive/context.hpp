/**
 * @file context.hpp
 * @brief Caller-supplied context: a string-keyed JSON object
 */

#pragma once

#include <export.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace Russell {

using Context = nlohmann::json;

/**
 * @brief Compact dump with sorted keys; null normalizes to "{}"
 */
RUSSELL_API std::string normalize_context(const Context& context);

/**
 * @brief Trimmed query with whitespace runs collapsed (case preserved)
 */
RUSSELL_API std::string normalize_query(const std::string& query);

/**
 * @brief Cache key for a (query, context, depth) triple
 *
 * Length-prefixed concatenation of the full normalized content, so two
 * different triples can never share a key.
 */
RUSSELL_API std::string make_cache_key(const std::string& query, const Context& context, int depth);

} // namespace Russell
