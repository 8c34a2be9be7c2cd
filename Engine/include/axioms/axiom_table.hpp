/**
 * @file axiom_table.hpp
 * @brief The fixed table of foundational axioms
 *
 *   A1  Conscious experience exists      1.00  ontological
 *   A2  A = A (Identity)                 1.00  logical
 *   A3  Not (A and not-A)                1.00  logical
 *   A4  Either A or not-A                1.00  logical
 *   A5  Information is conserved         0.99  physical
 *   A6  Emergence exists                 0.95  systemic
 *
 * Loaded once, immutable for the process lifetime.
 */

#pragma once

#include <export.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace Russell {

enum class AxiomCategory {
    Ontological,
    Logical,
    Physical,
    Systemic
};

RUSSELL_API const char* to_string(AxiomCategory category);

struct Axiom {
    std::string id;
    std::string statement;
    double certainty;
    AxiomCategory category;
    std::string description;
    std::vector<std::string> allowed_transformations;

    bool allows(std::string_view transformation) const;
};

class RUSSELL_API AxiomTable {
public:
    /**
     * @brief The process-wide table (constructed on first use)
     */
    static const AxiomTable& instance();

    const std::vector<Axiom>& all() const { return axioms_; }
    size_t size() const { return axioms_.size(); }

    /**
     * @brief nullptr for an unknown id
     */
    const Axiom* find(std::string_view id) const;

    /**
     * @brief False for an unknown axiom or a transformation outside its vocabulary
     */
    bool allows(std::string_view axiom_id, std::string_view transformation) const;

private:
    AxiomTable();

    std::vector<Axiom> axioms_;
};

} // namespace Russell
