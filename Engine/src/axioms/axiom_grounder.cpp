/**
 * @file axiom_grounder.cpp
 * @brief Deterministic proof construction and certainty aggregation
 */

#include <axioms/axiom_grounder.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <Eigen/Core>
#include <algorithm>
#include <cmath>
#include <set>

namespace Russell {

namespace {

const std::vector<std::string>& contradiction_markers() {
    static const std::vector<std::string> markers = {
        "and not", "but not", "however not", "although not",
        "false true", "true false", "yes no", "no yes",
        "contradiction", "paradox"
    };
    return markers;
}

} // namespace

// =============================================================================
// GroundedStatement
// =============================================================================

GroundedStatement::GroundedStatement(std::string statement, std::vector<ProofStep> steps,
                                     double certainty, bool fallback)
    : statement_(std::move(statement)),
      steps_(std::move(steps)),
      certainty_(std::clamp(certainty, 0.0, 1.0)),
      fallback_(fallback),
      hash_(compute_hash(statement_, steps_)),
      created_at_(Timer::unix_seconds()) {}

std::vector<std::string> GroundedStatement::axioms_used() const {
    std::vector<std::string> used;
    for (const auto& step : steps_) {
        if (std::find(used.begin(), used.end(), step.axiom_id) == used.end()) {
            used.push_back(step.axiom_id);
        }
    }
    return used;
}

bool GroundedStatement::verify_proof() const {
    return AxiomGrounder::verify_proof(steps_);
}

std::string GroundedStatement::compute_hash(const std::string& statement,
                                            const std::vector<ProofStep>& steps) {
    BLAKE3Pipeline::Incremental hasher;
    hasher.field(statement);
    hasher.field(static_cast<int64_t>(steps.size()));
    for (const auto& step : steps) {
        hasher.field(step.axiom_id)
              .field(step.transformation)
              .field(step.result)
              .field(step.certainty);
    }
    return hasher.finalize_hex();
}

// =============================================================================
// AxiomGrounder
// =============================================================================

AxiomGrounder::AxiomGrounder() = default;

GroundedStatement AxiomGrounder::ground(const std::string& statement, const Context& /*context*/) {
    return assemble(statement, generate_proof(statement));
}

GroundedStatement AxiomGrounder::assemble(const std::string& statement, std::vector<ProofStep> steps) {
    if (!steps.empty() && verify_proof(steps)) {
        double certainty = calculate_certainty(steps);
        GroundedStatement grounded(statement, std::move(steps), certainty);
        record(grounded);
        return grounded;
    }

    Logger::warn("Proof failed verification, using minimal grounding for: " + statement);

    GroundedStatement fallback(
        statement,
        {ProofStep{"A1", "existential", "unproven", 0.1}},
        0.1,
        true
    );
    ++fallbacks_;
    record(fallback);
    return fallback;
}

std::vector<ProofStep> AxiomGrounder::generate_proof(const std::string& statement) const {
    std::vector<ProofStep> steps;

    steps.push_back({"A1", "existential", "'" + statement + "' exists as conscious content", 1.0});
    steps.push_back({"A2", "identity", "Statement is self-identical", 1.0});

    if (has_contradiction(statement)) {
        steps.push_back({"A3", "contradiction_elimination", "Contradiction resolved", 1.0});
    }

    steps.push_back({"A4", "disjunction", "Statement or its negation holds", 1.0});

    // std::string::size() is the UTF-8 byte length
    steps.push_back({"A5", "conservation",
                     "Information conserved (" + std::to_string(statement.size()) + " bytes)", 0.99});

    double complexity = static_cast<double>(text::split_words(statement).size()) / 10.0;
    steps.push_back({"A6", "emergence_potential",
                     "Emergence potential: " + text::fixed(complexity, 2), 0.95});

    return steps;
}

bool AxiomGrounder::verify_proof(const std::vector<ProofStep>& steps) {
    const auto& table = AxiomTable::instance();
    for (const auto& step : steps) {
        if (!table.allows(step.axiom_id, step.transformation)) {
            return false;
        }
    }
    return true;
}

double AxiomGrounder::calculate_certainty(const std::vector<ProofStep>& steps) {
    if (steps.empty()) return 0.0;

    // Independence assumption: chain rule over steps
    double product = 1.0;
    std::set<std::string> distinct;
    for (const auto& step : steps) {
        product *= step.certainty;
        distinct.insert(step.axiom_id);
    }

    double depth_bonus = std::min(0.3, 0.05 * static_cast<double>(steps.size()));
    double consistency_bonus =
        static_cast<double>(distinct.size()) / static_cast<double>(AxiomTable::instance().size()) * 0.1;

    double total = std::clamp(product + depth_bonus + consistency_bonus, 0.0, 1.0);

    if (total > 0.8 && steps.size() >= 4) {
        total = std::max(total, 0.85);
    }

    return total;
}

bool AxiomGrounder::has_contradiction(const std::string& statement) {
    return text::contains_any(statement, contradiction_markers());
}

bool AxiomGrounder::is_known_proof(const std::string& hash) const {
    return proof_registry_.count(hash) > 0;
}

void AxiomGrounder::record(const GroundedStatement& grounded) {
    ++total_grounded_;
    if (proof_registry_.insert(grounded.hash()).second) {
        registry_order_.push_back(grounded.hash());
        if (registry_order_.size() > HISTORY_LIMIT) {
            proof_registry_.erase(registry_order_.front());
            registry_order_.pop_front();
        }
    }
    history_.push_back(grounded);
    if (history_.size() > HISTORY_LIMIT) {
        history_.pop_front();
    }
}

GroundingMetrics AxiomGrounder::metrics() const {
    GroundingMetrics m;
    m.total_grounded = total_grounded_;
    m.fallbacks = fallbacks_;
    m.proof_registry_size = proof_registry_.size();
    m.axioms_loaded = AxiomTable::instance().size();

    if (history_.empty()) return m;

    std::vector<double> certainties;
    certainties.reserve(history_.size());
    for (const auto& g : history_) certainties.push_back(g.certainty());

    Eigen::Map<const Eigen::VectorXd> samples(certainties.data(),
                                              static_cast<Eigen::Index>(certainties.size()));
    m.avg_certainty = samples.mean();
    m.std_certainty = std::sqrt((samples.array() - m.avg_certainty).square().mean());

    return m;
}

} // namespace Russell
