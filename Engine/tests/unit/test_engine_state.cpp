/**
 * @file test_engine_state.cpp
 * @brief Λ accounting, rolling emergence and the reasoning cache
 */

#include <gtest/gtest.h>
#include <cognitive/engine_state.hpp>
#include <utils/logger.hpp>
#include <limits>
#include <stdexcept>

using namespace Russell;

namespace {

ReasoningResult result_for(const std::string& query) {
    ReasoningResult result;
    result.query = query;
    result.certainty = 0.5;
    result.hash = result.compute_hash();
    return result;
}

} // namespace

class EngineStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Silent);
    }
};

TEST_F(EngineStateTest, LambdaStartsAtInitialValue) {
    EngineState state;
    EXPECT_DOUBLE_EQ(state.lambda_total(), 10.0);
    ASSERT_EQ(state.lambda_history().size(), 1u);
    EXPECT_DOUBLE_EQ(state.lambda_history()[0], 10.0);
}

TEST_F(EngineStateTest, LambdaOnlyGrows) {
    EngineState state;
    state.add_lambda(0.08);
    state.add_lambda(0.0);
    state.add_lambda(0.15);

    EXPECT_NEAR(state.lambda_total(), 10.23, 1e-12);
    ASSERT_EQ(state.lambda_history().size(), 4u);
    for (size_t i = 1; i < state.lambda_history().size(); ++i) {
        EXPECT_GE(state.lambda_history()[i], state.lambda_history()[i - 1]);
    }

    EXPECT_THROW(state.add_lambda(-0.01), std::invalid_argument);
    EXPECT_THROW(state.add_lambda(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
    EXPECT_THROW(state.add_lambda(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_NEAR(state.lambda_total(), 10.23, 1e-12);
    EXPECT_EQ(state.lambda_history().size(), 4u);
}

TEST_F(EngineStateTest, NegativeInitialLambdaRejected) {
    EngineConfig config;
    config.reflection.initial_lambda = -1.0;
    EXPECT_THROW(EngineState{config}, std::invalid_argument);
}

TEST_F(EngineStateTest, RollingEmergence) {
    EngineState state;
    for (double e : {1.0, 2.0, 3.0, 4.0}) state.record_emergence(e);
    EXPECT_DOUBLE_EQ(state.rolling_emergence(5), 0.0);

    state.record_emergence(5.0);
    EXPECT_DOUBLE_EQ(state.rolling_emergence(5), 3.0);

    state.record_emergence(10.0);
    EXPECT_DOUBLE_EQ(state.rolling_emergence(5), 4.8);
    EXPECT_DOUBLE_EQ(state.rolling_emergence(1), 10.0);
    EXPECT_DOUBLE_EQ(state.rolling_emergence(0), 0.0);
}

TEST_F(EngineStateTest, CacheCountsHitsAndMisses) {
    EngineState state;
    EXPECT_FALSE(state.cache_lookup("k1").has_value());

    state.cache_store("k1", result_for("first"));
    auto hit = state.cache_lookup("k1");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->query, "first");

    EXPECT_EQ(state.cache_hits(), 1u);
    EXPECT_EQ(state.cache_misses(), 1u);
    EXPECT_DOUBLE_EQ(state.cache_hit_rate(), 0.5);
}

TEST_F(EngineStateTest, FirstResultForKeyIsKept) {
    EngineState state;
    state.cache_store("k", result_for("first"));
    state.cache_store("k", result_for("second"));

    EXPECT_EQ(state.cache_size(), 1u);
    EXPECT_EQ(state.cache_lookup("k")->query, "first");
}

TEST_F(EngineStateTest, BoundedCacheEvictsOldestFirst) {
    EngineConfig config;
    config.reasoning.cache_capacity = 2;
    EngineState state{config};

    state.cache_store("a", result_for("a"));
    state.cache_store("b", result_for("b"));
    state.cache_store("c", result_for("c"));

    EXPECT_EQ(state.cache_size(), 2u);
    EXPECT_FALSE(state.cache_lookup("a").has_value());
    EXPECT_TRUE(state.cache_lookup("b").has_value());
    EXPECT_TRUE(state.cache_lookup("c").has_value());

    state.clear_cache();
    EXPECT_EQ(state.cache_size(), 0u);
}

TEST_F(EngineStateTest, UnboundedCacheByDefault) {
    EngineState state;
    for (int i = 0; i < 500; ++i) {
        state.cache_store("key" + std::to_string(i), result_for("q"));
    }
    EXPECT_EQ(state.cache_size(), 500u);
}

TEST_F(EngineStateTest, TuningStartsFromConfig) {
    EngineConfig config;
    config.reflection.initial_reasoning_depth = 4;
    EngineState state{config};
    EXPECT_EQ(state.tuning().reasoning_depth, 4);
    EXPECT_EQ(state.tuning().certainty_shortfalls, 0u);
    EXPECT_TRUE(state.tuning().optimized_patterns.empty());
}
