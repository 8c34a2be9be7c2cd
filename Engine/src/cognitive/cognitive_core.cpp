/**
 * @file cognitive_core.cpp
 * @brief Pipeline orchestration, metrics and persistence hand-off
 */

#include <cognitive/cognitive_core.hpp>
#include <utils/logger.hpp>
#include <utils/text.hpp>
#include <utils/time.hpp>
#include <Eigen/Core>
#include <algorithm>

namespace Russell {

namespace {

double mean_of(const std::vector<double>& samples) {
    if (samples.empty()) return 0.0;
    return Eigen::Map<const Eigen::VectorXd>(samples.data(),
                                             static_cast<Eigen::Index>(samples.size())).mean();
}

const EngineConfig& validated(const EngineConfig& config) {
    config.validate();
    return config;
}

} // namespace

CognitiveCore::CognitiveCore(const EngineConfig& config, std::shared_ptr<PersistenceSink> sink)
    : config_(validated(config)),
      state_(config_),
      reasoning_(state_, config_.reasoning),
      reflection_(reasoning_, state_, config_.reflection),
      safety_(config_.safety),
      sink_(std::move(sink)) {
    Logger::debug("Cognitive core ready: lambda=" + text::fixed(state_.lambda_total(), 2) +
                  " max_depth=" + std::to_string(config_.reasoning.max_depth) +
                  (sink_ ? " sink=" + sink_->name() : std::string(" sink=none")));
}

// =============================================================================
// Core operations
// =============================================================================

GroundedStatement CognitiveCore::ground(const std::string& statement, const Context& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    GroundedStatement grounded = grounder_.ground(statement, context);
    grounding_samples_.push_back(grounded.certainty());
    return grounded;
}

ReasoningResult CognitiveCore::reason_about(const std::string& query, const Context& context, int depth) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReasoningResult result = reasoning_.reason_about(query, context, depth);
    state_.record_certainty(result.certainty);
    ++queries_processed_;
    return result;
}

ReasoningResult CognitiveCore::reason_about(const std::string& query, const Context& context) {
    return reason_about(query, context, config_.reasoning.default_depth);
}

ReflectionOutcome CognitiveCore::reflect(const std::string& query, const Context& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    return reflection_.reflect(query, context);
}

// =============================================================================
// Pipeline
// =============================================================================

ReasoningPath CognitiveCore::process(const std::string& query) {
    ReasoningPath path;
    std::shared_ptr<PersistenceSink> sink;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++queries_processed_;

        GroundedStatement grounded = grounder_.ground(
            query, Context{{"query_number", queries_processed_}});
        grounding_samples_.push_back(grounded.certainty());

        int depth = optimal_depth_locked(query);
        Context reasoning_context = {
            {"grounding_hash", grounded.hash()},
            {"grounding_certainty", grounded.certainty()}
        };
        ReasoningResult reasoning = reasoning_.reason_about(query, reasoning_context, depth);
        state_.record_certainty(reasoning.certainty);

        ReflectionOutcome reflection = reflection_.reflect(
            query, Context{{"reasoning_hash", reasoning.hash}});

        path.id = "path_" + std::to_string(paths_stored_) + "_" +
                  std::to_string(static_cast<long long>(Timer::unix_seconds()));
        path.query = query;
        path.grounding_hash = grounded.hash();
        path.grounding_certainty = grounded.certainty();
        path.axioms_used = grounded.axioms_used();
        path.grounding_fallback = grounded.is_fallback();
        path.reasoning_depth = reasoning.depth_used;
        depth_samples_.push_back(static_cast<double>(reasoning.depth_used));
        path.emergence = reflection.metrics.emergence;
        path.lambda_impact = reflection.metrics.lambda_growth;
        path.safety = safety_.validate(query, grounded, reasoning, paths_stored_);
        path.convergence = ConvergenceDetector::analyze(state_.lambda_history());
        path.reasoning = std::move(reasoning);
        path.cycle = std::move(reflection.cycle);
        path.timestamp = Timer::unix_seconds();
        path.hash = path.compute_hash();

        ++paths_stored_;
        recent_safety_.push_back(path.safety.all_passed());
        if (recent_safety_.size() > RequirementsValidator::SAFETY_WINDOW) {
            recent_safety_.pop_front();
        }
        path.requirements = requirements_locked();
        sink = sink_;
    }

    if (!path.safety.all_passed()) {
        Logger::warn("Safety checks failed for " + path.id);
    }

    if (sink) {
        try {
            sink->store(path);
            path.persisted = true;
        } catch (const std::exception& e) {
            Logger::error("Persisting " + path.id + " to " + sink->name() + " failed: " + e.what());
            path.persisted = false;
        }
    }
    return path;
}

int CognitiveCore::optimal_depth(const std::string& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return optimal_depth_locked(query);
}

int CognitiveCore::optimal_depth_locked(const std::string& query) const {
    auto words = text::split_words(query);
    size_t word_count = words.size();
    size_t questions = static_cast<size_t>(std::count_if(words.begin(), words.end(),
        [](const std::string& w) { return text::ends_with(w, "?"); }));

    double complexity = static_cast<double>(word_count) / 10.0;
    double uncertainty = static_cast<double>(questions) /
                         static_cast<double>(std::max<size_t>(1, word_count));

    int complexity_bonus = std::min(5, static_cast<int>(complexity * 3.0));
    int uncertainty_bonus = std::min(3, static_cast<int>(uncertainty * 5.0));

    return std::min(config_.reasoning.max_depth,
                    state_.tuning().reasoning_depth + complexity_bonus + uncertainty_bonus);
}

// =============================================================================
// Metrics
// =============================================================================

EngineMetrics CognitiveCore::get_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    EngineMetrics m;
    m.avg_certainty = mean_of(state_.certainty_samples());
    m.avg_emergence = mean_of(state_.emergence_history());
    m.cache_hit_rate = state_.cache_hit_rate();
    m.lambda_total = state_.lambda_total();
    m.convergence = ConvergenceDetector::analyze(state_.lambda_history());
    m.avg_grounding_certainty = mean_of(grounding_samples_);
    m.avg_reasoning_depth = mean_of(depth_samples_);
    m.queries_processed = queries_processed_;
    m.cycles_completed = state_.cycles_completed();
    m.paths_stored = paths_stored_;
    m.cache_size = state_.cache_size();
    m.improvements_applied = state_.improvements_applied();
    m.improvements_failed = state_.improvements_failed();
    m.reasoning_depth = state_.tuning().reasoning_depth;
    m.requirements = requirements_locked();
    return m;
}

RequirementsReport CognitiveCore::requirements_locked() const {
    RequirementInputs in;
    in.recent_safety = recent_safety_;
    in.queries_processed = queries_processed_;
    in.paths_stored = paths_stored_;
    in.axioms_loaded = AxiomTable::instance().size();
    in.cycles_completed = state_.cycles_completed();
    in.lambda_total = state_.lambda_total();
    in.avg_emergence = mean_of(state_.emergence_history());
    in.convergence_confidence = ConvergenceDetector::analyze(state_.lambda_history()).confidence;
    return RequirementsValidator::evaluate(grounding_samples_, in);
}

ConvergenceReport CognitiveCore::convergence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ConvergenceDetector::analyze(state_.lambda_history());
}

// =============================================================================
// Accessors
// =============================================================================

void CognitiveCore::add_concept(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    reasoning_.add_concept(name);
}

void CognitiveCore::relate(const std::string& from, const std::string& to) {
    std::lock_guard<std::mutex> lock(mutex_);
    reasoning_.relate(from, to);
}

void CognitiveCore::set_sink(std::shared_ptr<PersistenceSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

double CognitiveCore::lambda_total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.lambda_total();
}

std::vector<double> CognitiveCore::lambda_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.lambda_history();
}

std::vector<ImprovementLogEntry> CognitiveCore::improvement_log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.improvement_log();
}

EngineTuning CognitiveCore::tuning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.tuning();
}

ReasoningStats CognitiveCore::reasoning_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reasoning_.stats();
}

GroundingMetrics CognitiveCore::grounding_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return grounder_.metrics();
}

} // namespace Russell
