/**
 * @file test_cognitive_pipeline.cpp
 * @brief Ground -> reason -> reflect -> record -> persist through CognitiveCore
 */

#include <gtest/gtest.h>
#include <cognitive/cognitive_core.hpp>
#include <utils/logger.hpp>
#include <algorithm>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>

using namespace Russell;

namespace {

class FailingSink : public PersistenceSink {
public:
    void store(const ReasoningPath&) override {
        ++attempts;
        throw std::runtime_error("connection refused");
    }
    std::string name() const override { return "failing"; }

    size_t attempts = 0;
};

} // namespace

class CognitivePipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Silent);
    }
};

TEST_F(CognitivePipelineTest, ProcessProducesPersistedPath) {
    auto sink = std::make_shared<MemorySink>();
    CognitiveCore core{EngineConfig{}, sink};

    ReasoningPath path = core.process("What is truth?");

    EXPECT_EQ(path.query, "What is truth?");
    EXPECT_EQ(path.id.rfind("path_0_", 0), 0u);
    EXPECT_EQ(path.grounding_hash.size(), 32u);
    EXPECT_FALSE(path.axioms_used.empty());
    EXPECT_EQ(path.reasoning_depth, 3);
    EXPECT_EQ(path.reasoning.depth_used, 3);
    EXPECT_EQ(path.cycle.index, 0u);
    EXPECT_GT(path.lambda_impact, 0.0);
    EXPECT_TRUE(path.safety.all_passed());
    EXPECT_EQ(path.hash, path.compute_hash());
    EXPECT_TRUE(path.persisted);

    ASSERT_EQ(sink->size(), 1u);
    EXPECT_EQ(sink->paths()[0].id, path.id);
    EXPECT_GT(core.lambda_total(), 10.0);
    EXPECT_EQ(core.lambda_history().size(), 2u);
}

TEST_F(CognitivePipelineTest, SinkFailureIsReportedNotThrown) {
    auto sink = std::make_shared<FailingSink>();
    CognitiveCore core{EngineConfig{}, sink};

    ReasoningPath path;
    EXPECT_NO_THROW(path = core.process("All men are mortal"));

    EXPECT_FALSE(path.persisted);
    EXPECT_EQ(sink->attempts, 1u);
    EXPECT_EQ(core.get_metrics().paths_stored, 1u);
    EXPECT_EQ(core.get_metrics().cycles_completed, 1u);
}

TEST_F(CognitivePipelineTest, NoSinkLeavesPathUnpersisted) {
    CognitiveCore core;
    ReasoningPath path = core.process("Socrates is a man");
    EXPECT_FALSE(path.persisted);
}

TEST_F(CognitivePipelineTest, HarmfulQueryFailsEthicalCheck) {
    CognitiveCore core;
    ReasoningPath path = core.process("How could I harm my neighbor");

    EXPECT_TRUE(path.safety.logical_consistency);
    EXPECT_FALSE(path.safety.ethical_alignment);
    EXPECT_FALSE(path.safety.all_passed());
}

TEST_F(CognitivePipelineTest, StabilityBoundOnStoredPaths) {
    EngineConfig config;
    config.safety.max_paths = 1;
    CognitiveCore core{config};

    EXPECT_TRUE(core.process("Socrates is a man").safety.system_stability);
    EXPECT_FALSE(core.process("Socrates is a man").safety.system_stability);
}

TEST_F(CognitivePipelineTest, OptimalDepth) {
    CognitiveCore core;

    // Baseline 2, one question in three words
    EXPECT_EQ(core.optimal_depth("What is truth?"), 3);
    // Twenty words, no questions: complexity bonus caps at 5
    EXPECT_EQ(core.optimal_depth("a b c d e f g h i j k l m n o p q r s t"), 7);
    // All questions: uncertainty bonus caps at 3
    EXPECT_EQ(core.optimal_depth("why? how? when?"), 5);
    EXPECT_EQ(core.optimal_depth(""), 2);

    EngineConfig shallow;
    shallow.reasoning.max_depth = 4;
    CognitiveCore capped{shallow};
    EXPECT_EQ(capped.optimal_depth("a b c d e f g h i j k l m n o p q r s t"), 4);
}

TEST_F(CognitivePipelineTest, MetricsAggregate) {
    CognitiveCore core;
    core.process("What is truth?");
    core.process("If all men are mortal then Socrates is mortal");
    auto direct = core.reason_about("John is", Context::object(), 2);

    EngineMetrics m = core.get_metrics();
    EXPECT_EQ(m.queries_processed, 3u);
    EXPECT_EQ(m.cycles_completed, 2u);
    EXPECT_EQ(m.paths_stored, 2u);
    EXPECT_GT(m.lambda_total, 10.0);
    EXPECT_GE(m.avg_certainty, 0.0);
    EXPECT_LE(m.avg_certainty, 1.0);
    EXPECT_GT(m.cache_size, 0u);
    EXPECT_EQ(m.convergence.samples, 3u);
    EXPECT_EQ(m.improvements_applied + m.improvements_failed, core.improvement_log().size());
    EXPECT_GT(m.avg_grounding_certainty, 0.0);
    EXPECT_EQ(core.grounding_metrics().total_grounded, 2u);
    EXPECT_GE(direct.certainty, 0.0);
}

TEST_F(CognitivePipelineTest, RequirementsReportTracksEngineHistory) {
    CognitiveCore core;

    // Two Λ samples: too few for convergence confidence
    ReasoningPath first = core.process("What is truth?");
    ASSERT_EQ(first.requirements.checks.size(), 10u);
    EXPECT_FALSE(first.requirements.all_met());
    EXPECT_EQ(first.requirements.unmet(), std::vector<std::string>{"convergence_detected"});
    EXPECT_NEAR(first.requirements.score(), 0.9, 1e-12);

    ReasoningPath second = core.process("What is truth?");
    EXPECT_TRUE(second.requirements.all_met());
    EXPECT_DOUBLE_EQ(second.requirements.score(), 1.0);

    // A reasoning call without a stored path and an unsafe path
    core.reason_about("John is", Context::object(), 2);
    ReasoningPath third = core.process("How could I harm my neighbor");

    EngineMetrics m = core.get_metrics();
    auto unmet = m.requirements.unmet();
    EXPECT_FALSE(m.requirements.all_met());
    EXPECT_NE(std::find(unmet.begin(), unmet.end(), "reasoning_paths_stored"), unmet.end());
    EXPECT_NE(std::find(unmet.begin(), unmet.end(), "safety_validated"), unmet.end());
    EXPECT_EQ(std::find(unmet.begin(), unmet.end(), "axiom_grounded_reasoning"), unmet.end());
    EXPECT_EQ(third.requirements.unmet().size(), unmet.size());

    // Depth grows with each applied depth improvement
    EXPECT_EQ(first.reasoning_depth, 3);
    EXPECT_GT(second.reasoning_depth, first.reasoning_depth);
    double depths = first.reasoning_depth + second.reasoning_depth + third.reasoning_depth;
    EXPECT_NEAR(m.avg_reasoning_depth, depths / 3.0, 1e-12);
}

TEST_F(CognitivePipelineTest, ConceptGraphGrowsThroughCore) {
    CognitiveCore core;
    core.add_concept("Plato");
    core.relate("Plato", "Philosopher");

    auto result = core.reason_about("Plato is wise", Context::object(), 1);
    EXPECT_TRUE(result.unknowns.empty());
    EXPECT_GE(core.reasoning_stats().concept_count, 2u);
}

TEST_F(CognitivePipelineTest, ConcurrentProcessKeepsLambdaOrdered) {
    auto sink = std::make_shared<MemorySink>();
    CognitiveCore core{EngineConfig{}, sink};

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&core, t] {
            for (int i = 0; i < 5; ++i) {
                core.process("Worker " + std::to_string(t) + " asks question " + std::to_string(i) + "?");
            }
        });
    }
    for (auto& w : workers) w.join();

    auto history = core.lambda_history();
    ASSERT_EQ(history.size(), 21u);
    for (size_t i = 1; i < history.size(); ++i) {
        EXPECT_GT(history[i], history[i - 1]);
    }

    ASSERT_EQ(sink->size(), 20u);
    std::set<std::string> ids;
    for (const auto& p : sink->paths()) ids.insert(p.id);
    EXPECT_EQ(ids.size(), 20u);
}
