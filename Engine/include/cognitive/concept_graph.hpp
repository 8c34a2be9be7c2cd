/**
 * @file concept_graph.hpp
 * @brief Adjacency of concept name → related concept names
 */

#pragma once

#include <export.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Russell {

class RUSSELL_API ConceptGraph {
public:
    /**
     * @brief Empty graph
     */
    ConceptGraph() = default;

    /**
     * @brief Graph seeded with the logical operators
     *        (AND OR NOT IMPLIES IFF FORALL EXISTS EQUALS NOT_EQUALS → operator_<NAME>)
     */
    static ConceptGraph with_logical_operators();

    void add_concept(const std::string& name);

    /**
     * @brief Directed edge; both endpoints become concepts
     */
    void relate(const std::string& from, const std::string& to);

    bool contains(const std::string& name) const;

    /**
     * @brief Exact-case name of a concept matching ignoring case
     */
    std::optional<std::string> find_case_insensitive(const std::string& name) const;

    /**
     * @brief Related concepts in lexical order (empty for unknown names)
     */
    std::vector<std::string> neighbors(const std::string& name) const;

    size_t size() const { return adjacency_.size(); }

private:
    std::map<std::string, std::set<std::string>> adjacency_;
};

} // namespace Russell
