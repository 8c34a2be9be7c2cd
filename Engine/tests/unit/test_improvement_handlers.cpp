/**
 * @file test_improvement_handlers.cpp
 * @brief Static handler table: proposals are data, handlers mutate tuning
 */

#include <gtest/gtest.h>
#include <cognitive/engine_state.hpp>
#include <cognitive/improvement_handlers.hpp>
#include <stdexcept>

using namespace Russell;

class ImprovementHandlerTest : public ::testing::Test {
protected:
    EngineState state;
};

TEST_F(ImprovementHandlerTest, EveryKindHasAHandler) {
    EXPECT_NE(handler_for(ImprovementKind::IncreaseDepth), nullptr);
    EXPECT_NE(handler_for(ImprovementKind::ImproveCertainty), nullptr);
    EXPECT_NE(handler_for(ImprovementKind::OptimizePatterns), nullptr);
    EXPECT_NE(handler_for(ImprovementKind::IncreaseDepth),
              handler_for(ImprovementKind::OptimizePatterns));
}

TEST_F(ImprovementHandlerTest, IncreaseDepthSetsTarget) {
    ImprovementProposal p{ImprovementKind::IncreaseDepth, 2.0, 3.0, {}, 0.15};

    std::string result = apply_improvement(p, state);

    EXPECT_EQ(state.tuning().reasoning_depth, 3);
    EXPECT_EQ(result, "Reasoning depth 2 -> 3");
}

TEST_F(ImprovementHandlerTest, IncreaseDepthRejectsInvalidTarget) {
    ImprovementProposal p{ImprovementKind::IncreaseDepth, 2.0, 0.0, {}, 0.15};
    EXPECT_THROW(apply_improvement(p, state), std::invalid_argument);
    EXPECT_EQ(state.tuning().reasoning_depth, 2);
}

TEST_F(ImprovementHandlerTest, ImproveCertaintyRecordsShortfall) {
    ImprovementProposal p{ImprovementKind::ImproveCertainty, 0.6, 0.7, {}, 0.1};

    apply_improvement(p, state);
    apply_improvement(p, state);

    EXPECT_EQ(state.tuning().certainty_shortfalls, 2u);
    EXPECT_NEAR(state.tuning().last_certainty_gap, 0.1, 1e-12);
}

TEST_F(ImprovementHandlerTest, ImproveCertaintyFailsWhenTargetMet) {
    ImprovementProposal p{ImprovementKind::ImproveCertainty, 0.8, 0.7, {}, 0.1};
    EXPECT_THROW(apply_improvement(p, state), std::invalid_argument);
    EXPECT_EQ(state.tuning().certainty_shortfalls, 0u);
}

TEST_F(ImprovementHandlerTest, OptimizePatterns) {
    ImprovementProposal p{ImprovementKind::OptimizePatterns, 0.0, 0.0,
                          {"unresolved_unknowns", "redundant_refinement"}, 0.2};

    apply_improvement(p, state);

    EXPECT_EQ(state.tuning().optimized_patterns.size(), 2u);
    EXPECT_EQ(state.tuning().optimized_patterns.count("redundant_refinement"), 1u);

    ImprovementProposal empty{ImprovementKind::OptimizePatterns, 0.0, 0.0, {}, 0.2};
    EXPECT_THROW(apply_improvement(empty, state), std::invalid_argument);
}

TEST_F(ImprovementHandlerTest, OutOfRangeKindThrows) {
    EXPECT_THROW(handler_for(static_cast<ImprovementKind>(7)), std::out_of_range);
}

TEST_F(ImprovementHandlerTest, LogCountsSuccessAndFailure) {
    state.log_improvement({"r3_0_0", ImprovementKind::IncreaseDepth, true, "ok", "", 1.0});
    state.log_improvement({"r3_0_0", ImprovementKind::OptimizePatterns, false, "", "No patterns", 1.0});

    EXPECT_EQ(state.improvements_applied(), 1u);
    EXPECT_EQ(state.improvements_failed(), 1u);
    EXPECT_EQ(state.improvement_log().back().error, "No patterns");
}
