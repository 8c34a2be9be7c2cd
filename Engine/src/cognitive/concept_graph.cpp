#include <cognitive/concept_graph.hpp>
#include <utils/text.hpp>

namespace Russell {

ConceptGraph ConceptGraph::with_logical_operators() {
    ConceptGraph graph;
    static const char* operators[] = {
        "AND", "OR", "NOT", "IMPLIES", "IFF",
        "FORALL", "EXISTS", "EQUALS", "NOT_EQUALS"
    };
    for (const char* op : operators) {
        graph.relate(op, std::string("operator_") + op);
    }
    return graph;
}

void ConceptGraph::add_concept(const std::string& name) {
    adjacency_[name];
}

void ConceptGraph::relate(const std::string& from, const std::string& to) {
    adjacency_[from].insert(to);
    adjacency_[to];
}

bool ConceptGraph::contains(const std::string& name) const {
    return adjacency_.count(name) > 0;
}

std::optional<std::string> ConceptGraph::find_case_insensitive(const std::string& name) const {
    std::string lower = text::to_lower(name);
    for (const auto& [concept_name, related] : adjacency_) {
        if (text::to_lower(concept_name) == lower) return concept_name;
    }
    return std::nullopt;
}

std::vector<std::string> ConceptGraph::neighbors(const std::string& name) const {
    auto it = adjacency_.find(name);
    if (it == adjacency_.end()) return {};
    return {it->second.begin(), it->second.end()};
}

} // namespace Russell
