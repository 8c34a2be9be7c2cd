/**
 * @file component_extractor.cpp
 * @brief Lexical component extraction
 */

#include <cognitive/component_extractor.hpp>
#include <utils/text.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace Russell {

namespace {

const std::unordered_set<std::string> kPronouns = {
    "i", "you", "he", "she", "it", "we", "they"
};

const std::unordered_set<std::string> kRelations = {
    "is", "has", "can", "does", "will", "should", "must"
};

const std::unordered_set<std::string> kQuantifiers = {
    "all", "every", "some", "no", "none"
};

const std::unordered_set<std::string> kModalities = {
    "possible", "necessary", "impossible"
};

const std::unordered_set<std::string> kConnectives = {
    "if", "then", "and", "or", "not", "but", "however",
    "implies", "iff", "true", "false", "yes"
};

} // namespace

bool QueryComponents::has_connective(const std::string& word) const {
    return std::find(connectives.begin(), connectives.end(), word) != connectives.end();
}

std::string QueryComponents::flatten() const {
    return text::join(sequence, " ");
}

bool LexicalComponentExtractor::is_pronoun(const std::string& word) {
    return kPronouns.count(text::to_lower(word)) > 0;
}

QueryComponents LexicalComponentExtractor::extract(const std::string& query) const {
    QueryComponents components;

    for (const auto& raw : text::split_words(query)) {
        std::string word = text::strip_punctuation(raw);
        if (word.empty()) continue;

        std::string lower = text::to_lower(word);
        bool capitalized = std::isupper(static_cast<unsigned char>(word[0])) != 0;

        if ((capitalized && word.size() > 2) || kPronouns.count(lower)) {
            components.entities.push_back(word);
        } else if (kRelations.count(lower)) {
            components.relations.push_back(lower);
        } else if (kQuantifiers.count(lower)) {
            components.quantifiers.push_back(lower);
        } else if (kModalities.count(lower)) {
            components.modalities.push_back(lower);
        } else if (text::ends_with(lower, "ing") || text::ends_with(lower, "ed")) {
            components.actions.push_back(lower);
        } else if (kConnectives.count(lower)) {
            components.connectives.push_back(lower);
        } else {
            continue;
        }

        components.sequence.push_back(lower);
    }

    return components;
}

} // namespace Russell
