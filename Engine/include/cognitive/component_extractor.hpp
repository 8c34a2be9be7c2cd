/**
 * @file component_extractor.hpp
 * @brief Structural component extraction from a query
 *
 * The lexical extractor is a heuristic placeholder, not linguistic analysis.
 * ReasoningEngine depends only on the ComponentExtractor contract, so an NLP
 * backed implementation can replace it without touching the scoring math.
 */

#pragma once

#include <export.hpp>
#include <string>
#include <vector>

namespace Russell {

struct QueryComponents {
    std::vector<std::string> entities;     // Capitalized tokens (len > 2) and pronouns
    std::vector<std::string> relations;    // Copula / modal tokens, lower-cased
    std::vector<std::string> quantifiers;  // all, every, some, no, none
    std::vector<std::string> modalities;   // possible, necessary, impossible
    std::vector<std::string> actions;      // -ing / -ed tokens, lower-cased
    std::vector<std::string> connectives;  // if, then, and, not, ...

    // Every classified token, lower-cased, in query order
    std::vector<std::string> sequence;

    size_t total() const {
        return entities.size() + relations.size() + quantifiers.size() +
               modalities.size() + actions.size() + connectives.size();
    }

    bool has_connective(const std::string& word) const;

    /**
     * @brief The component set as one lower-cased, space-joined string
     */
    std::string flatten() const;
};

class RUSSELL_API ComponentExtractor {
public:
    virtual ~ComponentExtractor() = default;

    virtual QueryComponents extract(const std::string& query) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Whitespace-token classifier
 *
 * Per token (punctuation stripped), first match wins:
 *   entity      capitalized and longer than 2, or a pronoun
 *   relation    is has can does will should must
 *   quantifier  all every some no none
 *   modality    possible necessary impossible
 *   action      ends in "ing" or "ed"
 *   connective  if then and or not but however implies iff true false yes
 */
class RUSSELL_API LexicalComponentExtractor : public ComponentExtractor {
public:
    QueryComponents extract(const std::string& query) const override;
    std::string name() const override { return "lexical"; }

    static bool is_pronoun(const std::string& word);
};

} // namespace Russell
