/**
 * @file text.hpp
 * @brief Lexical helpers shared by the grounder and the component extractor
 */

#pragma once

#include <export.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace Russell::text {

RUSSELL_API std::string to_lower(std::string_view s);

/**
 * @brief Trim and collapse internal whitespace runs to a single space
 */
RUSSELL_API std::string normalize_whitespace(std::string_view s);

/**
 * @brief Whitespace tokenization (no punctuation handling)
 */
RUSSELL_API std::vector<std::string> split_words(std::string_view s);

/**
 * @brief Strip leading and trailing ASCII punctuation
 */
RUSSELL_API std::string strip_punctuation(std::string_view word);

/**
 * @brief Case-insensitive substring scan for any of the markers
 */
RUSSELL_API bool contains_any(std::string_view haystack, const std::vector<std::string>& markers);

RUSSELL_API bool ends_with(std::string_view s, std::string_view suffix);

RUSSELL_API std::string join(const std::vector<std::string>& parts, std::string_view sep);

/**
 * @brief printf-style "%.Nf"
 */
RUSSELL_API std::string fixed(double value, int precision);

} // namespace Russell::text
