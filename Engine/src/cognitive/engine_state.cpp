/**
 * @file engine_state.cpp
 * @brief Λ accounting, histories and the reasoning cache
 */

#include <cognitive/engine_state.hpp>
#include <utils/logger.hpp>
#include <Eigen/Core>
#include <cmath>
#include <stdexcept>

namespace Russell {

EngineState::EngineState(const EngineConfig& config)
    : lambda_total_(config.reflection.initial_lambda),
      cache_capacity_(config.reasoning.cache_capacity) {
    if (!std::isfinite(lambda_total_) || lambda_total_ < 0.0) {
        throw std::invalid_argument("Initial lambda must be finite and non-negative");
    }
    lambda_history_.push_back(lambda_total_);
    tuning_.reasoning_depth = config.reflection.initial_reasoning_depth;
}

void EngineState::add_lambda(double impact) {
    if (!std::isfinite(impact) || impact < 0.0) {
        throw std::invalid_argument("Lambda impact must be finite and non-negative, got " +
                                    std::to_string(impact));
    }
    lambda_total_ += impact;
    lambda_history_.push_back(lambda_total_);
}

void EngineState::append_cycle(ReflectionCycle cycle) {
    cycles_.push_back(std::move(cycle));
}

void EngineState::record_emergence(double emergence) {
    emergence_history_.push_back(emergence);
}

double EngineState::rolling_emergence(size_t window) const {
    if (window == 0 || emergence_history_.size() < window) return 0.0;

    Eigen::Map<const Eigen::VectorXd> tail(
        emergence_history_.data() + (emergence_history_.size() - window),
        static_cast<Eigen::Index>(window));
    return tail.mean();
}

std::optional<ReasoningResult> EngineState::cache_lookup(const std::string& key) {
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        ++cache_misses_;
        return std::nullopt;
    }
    ++cache_hits_;
    return it->second;
}

void EngineState::cache_store(const std::string& key, const ReasoningResult& result) {
    auto [it, inserted] = cache_.emplace(key, result);
    if (!inserted) return;  // First result for a key wins

    cache_order_.push_back(key);
    if (cache_capacity_ > 0 && cache_.size() > cache_capacity_) {
        cache_.erase(cache_order_.front());
        cache_order_.pop_front();
        Logger::debug("Reasoning cache evicted oldest entry (capacity " +
                      std::to_string(cache_capacity_) + ")");
    }
}

void EngineState::clear_cache() {
    cache_.clear();
    cache_order_.clear();
}

double EngineState::cache_hit_rate() const {
    size_t lookups = cache_hits_ + cache_misses_;
    return lookups ? static_cast<double>(cache_hits_) / static_cast<double>(lookups) : 0.0;
}

void EngineState::log_improvement(ImprovementLogEntry entry) {
    if (entry.success) ++improvements_applied_;
    else ++improvements_failed_;
    improvement_log_.push_back(std::move(entry));
}

} // namespace Russell
