#include <axioms/axiom_table.hpp>
#include <algorithm>

namespace Russell {

const char* to_string(AxiomCategory category) {
    switch (category) {
        case AxiomCategory::Ontological: return "ontological";
        case AxiomCategory::Logical:     return "logical";
        case AxiomCategory::Physical:    return "physical";
        case AxiomCategory::Systemic:    return "systemic";
    }
    return "unknown";
}

bool Axiom::allows(std::string_view transformation) const {
    return std::find(allowed_transformations.begin(), allowed_transformations.end(),
                     transformation) != allowed_transformations.end();
}

AxiomTable::AxiomTable() {
    axioms_ = {
        {"A1", "Conscious experience exists", 1.0, AxiomCategory::Ontological,
         "First-person experience is fundamental",
         {"existential", "instantiation"}},
        {"A2", "A = A (Identity)", 1.0, AxiomCategory::Logical,
         "Law of identity",
         {"identity", "reflexive", "symmetric", "transitive"}},
        {"A3", "Not (A and not-A)", 1.0, AxiomCategory::Logical,
         "Law of non-contradiction",
         {"negation", "contradiction_elimination"}},
        {"A4", "Either A or not-A", 1.0, AxiomCategory::Logical,
         "Law of excluded middle",
         {"disjunction", "choice", "partition"}},
        {"A5", "Information is conserved", 0.99, AxiomCategory::Physical,
         "Conservation of information",
         {"conservation", "invariance", "symmetry"}},
        {"A6", "Emergence exists", 0.95, AxiomCategory::Systemic,
         "Complex systems exhibit novel properties",
         {"composition", "hierarchy", "emergence_detection", "emergence_potential"}},
    };
}

const AxiomTable& AxiomTable::instance() {
    static const AxiomTable table;
    return table;
}

const Axiom* AxiomTable::find(std::string_view id) const {
    for (const auto& axiom : axioms_) {
        if (axiom.id == id) return &axiom;
    }
    return nullptr;
}

bool AxiomTable::allows(std::string_view axiom_id, std::string_view transformation) const {
    const Axiom* axiom = find(axiom_id);
    return axiom && axiom->allows(transformation);
}

} // namespace Russell
