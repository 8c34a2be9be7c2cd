/**
 * @file test_record_json.cpp
 * @brief JSON shapes of engine records
 */

#include <gtest/gtest.h>
#include <serialization/record_json.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

using namespace Russell;
using json = nlohmann::json;

class RecordJsonTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Silent);
    }
};

TEST_F(RecordJsonTest, GroundedStatement) {
    AxiomGrounder grounder;
    json j = grounder.ground("A = A");

    EXPECT_EQ(j["statement"], "A = A");
    ASSERT_TRUE(j["proof_steps"].is_array());
    EXPECT_FALSE(j["proof_steps"].empty());
    EXPECT_TRUE(j["proof_steps"][0].contains("axiom_id"));
    EXPECT_EQ(j["hash"].get<std::string>().size(), 32u);
    EXPECT_FALSE(j["fallback"].get<bool>());
}

TEST_F(RecordJsonTest, AxiomCategoryIsNamed) {
    json j = *AxiomTable::instance().find("A1");
    EXPECT_EQ(j["id"], "A1");
    EXPECT_TRUE(j["category"].is_string());
    EXPECT_TRUE(j["allowed_transformations"].is_array());
}

TEST_F(RecordJsonTest, ReasoningResultWithoutRefinement) {
    EngineState state;
    ReasoningEngine engine{state};
    json j = engine.reason_about("John is", Context::object(), 1);

    EXPECT_EQ(j["query"], "John is");
    EXPECT_EQ(j["depth"], 1);
    EXPECT_TRUE(j["refinement"].is_null());
    EXPECT_EQ(j["refinement_count"], 0);
    EXPECT_EQ(j["components"]["entities"], json::array({"John"}));
}

TEST_F(RecordJsonTest, RefinementChainNests) {
    EngineState state;
    ReasoningEngine engine{state};
    json j = engine.reason_about("John is", Context::object(), 3);

    ASSERT_TRUE(j["refinement"].is_object());
    EXPECT_EQ(j["refinement"]["level"], 1);
    EXPECT_TRUE(j["refinement"]["refinements"].is_array());
    EXPECT_EQ(j["refinement"]["refinements"][0]["kind"], "hypothesis");
    EXPECT_TRUE(j["refinement"].contains("next"));
}

TEST_F(RecordJsonTest, ProposalParsesBack) {
    json j = {
        {"type", "optimize_patterns"},
        {"patterns", {"unresolved_unknowns"}},
        {"impact", 0.2}
    };
    auto proposal = j.get<ImprovementProposal>();

    EXPECT_EQ(proposal.kind, ImprovementKind::OptimizePatterns);
    EXPECT_EQ(proposal.patterns, std::vector<std::string>{"unresolved_unknowns"});
    EXPECT_DOUBLE_EQ(proposal.impact, 0.2);
    EXPECT_DOUBLE_EQ(proposal.current_value, 0.0);

    json back = proposal;
    EXPECT_EQ(back["type"], "optimize_patterns");
}

TEST_F(RecordJsonTest, UnknownProposalKindRejected) {
    json j = {{"type", "rewrite_everything"}};
    EXPECT_THROW(j.get<ImprovementProposal>(), std::invalid_argument);
    EXPECT_THROW(improvement_kind_from_string(""), std::invalid_argument);
    EXPECT_EQ(improvement_kind_from_string("improve_certainty"), ImprovementKind::ImproveCertainty);
}

TEST_F(RecordJsonTest, CycleListsReflectionsInOrder) {
    EngineConfig config;
    EngineState state{config};
    ReasoningEngine reasoning{state, config.reasoning};
    ReflectionEngine reflection{reasoning, state, config.reflection};

    json j = reflection.reflect("What is truth?");

    const json& cycle = j["cycle"];
    ASSERT_EQ(cycle["reflections"].size(), 4u);
    EXPECT_EQ(cycle["reflections"][0]["level"], "reflexive");
    EXPECT_EQ(cycle["reflections"][1]["level"], "recursive");
    EXPECT_EQ(cycle["reflections"][2]["level"], "regenerative");
    EXPECT_EQ(cycle["reflections"][3]["level"], "transcendent");
    EXPECT_EQ(cycle["input_state"]["query"], "What is truth?");
    EXPECT_EQ(cycle["improvements"].size(), cycle["reflections"][2]["improvements"].size());
    EXPECT_TRUE(j["metrics"]["refinement_level"].is_number_integer());
}

TEST_F(RecordJsonTest, ImprovementLogEntryCarriesResultOrError) {
    json ok = ImprovementLogEntry{"r3_0_1", ImprovementKind::IncreaseDepth, true, "Reasoning depth 2 -> 3", "", 1.0};
    json failed = ImprovementLogEntry{"r3_0_1", ImprovementKind::OptimizePatterns, false, "", "No patterns to optimize", 1.0};

    EXPECT_EQ(ok["improvement"], "increase_reasoning_depth");
    EXPECT_TRUE(ok.contains("result"));
    EXPECT_FALSE(ok.contains("error"));

    EXPECT_FALSE(failed["success"].get<bool>());
    EXPECT_EQ(failed["error"], "No patterns to optimize");
    EXPECT_FALSE(failed.contains("result"));
}

TEST_F(RecordJsonTest, SafetyChecksSummarize) {
    SafetyChecks checks;
    checks.logical_consistency = true;
    checks.no_contradictions = true;
    checks.ethical_alignment = false;
    checks.system_stability = true;

    json j = checks;
    EXPECT_FALSE(j["all_passed"].get<bool>());
    EXPECT_FALSE(j["ethical_alignment"].get<bool>());
}

TEST_F(RecordJsonTest, RequirementsReportNamesEachCheck) {
    RequirementsReport report;
    report.checks = {{"lambda_tracked", true}, {"convergence_detected", false}};

    json j = report;
    EXPECT_TRUE(j["requirements"]["lambda_tracked"].get<bool>());
    EXPECT_FALSE(j["requirements"]["convergence_detected"].get<bool>());
    EXPECT_FALSE(j["all_met"].get<bool>());
    EXPECT_DOUBLE_EQ(j["score"].get<double>(), 0.5);
}

TEST_F(RecordJsonTest, DumpReplacesInvalidUtf8) {
    json j = {{"query", std::string("bad \xFF byte")}};
    std::string text = dump_record(j);
    EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_THROW(j.dump(), json::type_error);
}
