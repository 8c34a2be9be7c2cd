/**
 * @file axiom_grounder.hpp
 * @brief Axiom grounding: attach a proof and certainty to any statement
 *
 * Proof sequence (evaluated per statement, in order):
 *   A1 existential                 1.00  always
 *   A2 identity                    1.00  always
 *   A3 contradiction_elimination   1.00  only when a contradiction marker matches
 *   A4 disjunction                 1.00  always
 *   A5 conservation                0.99  always (narrative carries byte length)
 *   A6 emergence_potential         0.95  always (narrative carries words / 10)
 *
 * Certainty = Π step certainties + min(0.3, 0.05 × steps)
 *           + (distinct axioms / total axioms) × 0.1, clamped to [0, 1];
 * raised to at least 0.85 when above 0.8 with four or more steps.
 */

#pragma once

#include <axioms/axiom_table.hpp>
#include <cognitive/context.hpp>
#include <export.hpp>
#include <deque>
#include <string>
#include <unordered_set>
#include <vector>

namespace Russell {

struct ProofStep {
    std::string axiom_id;
    std::string transformation;
    std::string result;       // Narrative
    double certainty;

    bool operator==(const ProofStep&) const = default;
};

/**
 * @brief A statement with its proof; immutable once constructed
 */
class RUSSELL_API GroundedStatement {
public:
    GroundedStatement(std::string statement, std::vector<ProofStep> steps,
                      double certainty, bool fallback = false);

    const std::string& statement() const { return statement_; }
    const std::vector<ProofStep>& proof_steps() const { return steps_; }
    double certainty() const { return certainty_; }
    const std::string& hash() const { return hash_; }
    double created_at() const { return created_at_; }
    bool is_fallback() const { return fallback_; }

    /**
     * @brief Distinct axiom ids in first-use order
     */
    std::vector<std::string> axioms_used() const;

    /**
     * @brief Every step's transformation belongs to its axiom's vocabulary
     */
    bool verify_proof() const;

    /**
     * @brief Digest over (statement, ordered step contents)
     */
    static std::string compute_hash(const std::string& statement, const std::vector<ProofStep>& steps);

private:
    std::string statement_;
    std::vector<ProofStep> steps_;
    double certainty_;
    bool fallback_;
    std::string hash_;
    double created_at_;
};

struct GroundingMetrics {
    size_t total_grounded = 0;
    size_t fallbacks = 0;
    double avg_certainty = 0.0;
    double std_certainty = 0.0;
    size_t proof_registry_size = 0;
    size_t axioms_loaded = 0;
};

class RUSSELL_API AxiomGrounder {
public:
    static constexpr size_t HISTORY_LIMIT = 1000;

    AxiomGrounder();

    /**
     * @brief Ground a statement. Never throws for any input text.
     */
    GroundedStatement ground(const std::string& statement, const Context& context = Context::object());

    /**
     * @brief Verify an arbitrary step sequence and finalize it
     *
     * Invalid proofs are replaced by the minimal fallback grounding
     * (A1 / existential / certainty 0.1).
     */
    GroundedStatement assemble(const std::string& statement, std::vector<ProofStep> steps);

    static bool verify_proof(const std::vector<ProofStep>& steps);
    static double calculate_certainty(const std::vector<ProofStep>& steps);
    static bool has_contradiction(const std::string& statement);

    /**
     * @brief Was this proof hash produced by this grounder?
     *
     * The registry keeps the most recent HISTORY_LIMIT distinct hashes.
     */
    bool is_known_proof(const std::string& hash) const;

    GroundingMetrics metrics() const;

private:
    std::vector<ProofStep> generate_proof(const std::string& statement) const;
    void record(const GroundedStatement& grounded);

    std::deque<GroundedStatement> history_;
    std::unordered_set<std::string> proof_registry_;
    std::deque<std::string> registry_order_;  // Insertion order for eviction
    size_t total_grounded_ = 0;
    size_t fallbacks_ = 0;
};

} // namespace Russell
