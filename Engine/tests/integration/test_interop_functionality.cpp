/**
 * @file test_interop_functionality.cpp
 * @brief Functional tests for the C Interop API.
 *
 * Exercises the exact call patterns a foreign-language binding uses:
 * opaque handles, JSON strings in and out, thread-local error reporting.
 */

#include <gtest/gtest.h>
#include <interop_api.h>
#include <hashing/blake3_pipeline.hpp>
#include <nlohmann/json.hpp>
#include <cstring>
#include <string>

using json = nlohmann::json;

namespace {

// Takes ownership of a string returned by the API
json take_json(char* raw) {
    EXPECT_NE(raw, nullptr) << russell_get_last_error();
    if (!raw) return json();
    json parsed = json::parse(raw);
    russell_free_string(raw);
    return parsed;
}

} // namespace

class InteropTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = russell_engine_create(R"({"log_level": "silent"})");
        ASSERT_NE(engine, nullptr) << russell_get_last_error();
    }

    void TearDown() override {
        russell_engine_destroy(engine);
        engine = nullptr;
    }

    h_engine_t engine = nullptr;
};

TEST(InteropLifecycleTest, VersionAndNullConfig) {
    EXPECT_STREQ(russell_get_version(), "0.1.0");

    h_engine_t engine = russell_engine_create(nullptr);
    ASSERT_NE(engine, nullptr);
    EXPECT_DOUBLE_EQ(russell_lambda_total(engine), 10.0);
    russell_engine_destroy(engine);

    // Destroying a null handle is a no-op
    russell_engine_destroy(nullptr);
}

TEST(InteropLifecycleTest, InvalidConfigReportsError) {
    EXPECT_EQ(russell_engine_create("{ broken"), nullptr);
    EXPECT_GT(std::strlen(russell_get_last_error()), 0u);

    EXPECT_EQ(russell_engine_create(R"({"reasoning": {"max_depth": 0}})"), nullptr);
    EXPECT_NE(std::string(russell_get_last_error()).find("max_depth"), std::string::npos);
}

TEST_F(InteropTest, GroundReturnsProof) {
    json grounded = take_json(russell_ground(engine, "A = A", nullptr));
    EXPECT_EQ(grounded["statement"], "A = A");
    EXPECT_FALSE(grounded["proof_steps"].empty());
    EXPECT_EQ(grounded["hash"].get<std::string>().size(), 32u);
}

TEST_F(InteropTest, ReasonUsesDefaultDepth) {
    json result = take_json(russell_reason(engine, "John is", nullptr, 0));
    EXPECT_EQ(result["depth"], 3);

    json shallow = take_json(russell_reason(engine, "John is", "{}", 1));
    EXPECT_EQ(shallow["depth"], 1);
    EXPECT_TRUE(shallow["refinement"].is_null());
}

TEST_F(InteropTest, ContextMustBeObject) {
    EXPECT_EQ(russell_reason(engine, "John is", "[1, 2]", 2), nullptr);
    EXPECT_NE(std::string(russell_get_last_error()).find("JSON object"), std::string::npos);

    EXPECT_EQ(russell_reason(engine, nullptr, nullptr, 2), nullptr);
    EXPECT_EQ(russell_reason(nullptr, "John is", nullptr, 2), nullptr);
}

TEST_F(InteropTest, ReflectGrowsLambda) {
    double before = russell_lambda_total(engine);
    json outcome = take_json(russell_reflect(engine, "What is truth?", nullptr));

    EXPECT_EQ(outcome["cycle"]["reflections"].size(), 4u);
    EXPECT_GT(russell_lambda_total(engine), before);
    EXPECT_NEAR(outcome["cycle"]["lambda_after"].get<double>(), russell_lambda_total(engine), 1e-12);
}

TEST_F(InteropTest, InvalidUtf8IsReplacedInOutput) {
    const std::string replacement = "\xEF\xBF\xBD";
    const char* query = "Caf\xC3 is \xFF broken";

    json path = take_json(russell_process(engine, query));
    ASSERT_TRUE(path["query"].is_string());
    EXPECT_NE(path["query"].get<std::string>().find(replacement), std::string::npos);

    json outcome = take_json(russell_reflect(engine, query, nullptr));
    std::string echoed = outcome["cycle"]["input_state"]["query"].get<std::string>();
    EXPECT_NE(echoed.find(replacement), std::string::npos);

    HEngineMetrics metrics{};
    ASSERT_TRUE(russell_get_metrics(engine, &metrics));
    EXPECT_EQ(metrics.cycles_completed, 2u);
    EXPECT_EQ(metrics.queries_processed, 1u);
}

TEST_F(InteropTest, ProcessAndMetrics) {
    json path = take_json(russell_process(engine, "If all men are mortal then Socrates is mortal"));
    EXPECT_TRUE(path["safety"]["all_passed"].is_boolean());
    EXPECT_FALSE(path["persisted"].get<bool>());

    HEngineMetrics metrics{};
    ASSERT_TRUE(russell_get_metrics(engine, &metrics));
    EXPECT_EQ(metrics.cycles_completed, 1u);
    EXPECT_EQ(metrics.queries_processed, 1u);
    EXPECT_GT(metrics.lambda_total, 10.0);

    json as_json = take_json(russell_get_metrics_json(engine));
    EXPECT_EQ(as_json["cycles_completed"], 1);

    EXPECT_FALSE(russell_get_metrics(engine, nullptr));
}

TEST_F(InteropTest, ConceptGraph) {
    ASSERT_TRUE(russell_add_concept(engine, "Plato"));
    ASSERT_TRUE(russell_relate(engine, "Plato", "Philosopher"));
    EXPECT_FALSE(russell_add_concept(engine, nullptr));

    json result = take_json(russell_reason(engine, "Plato is wise", nullptr, 1));
    EXPECT_TRUE(result["unknowns"].empty());
}

TEST(InteropPrimitivesTest, Blake3MatchesPipeline) {
    const char* data = "Russell";
    uint8_t out[16] = {0};
    russell_blake3_hash(data, std::strlen(data), out);

    auto expected = Russell::BLAKE3Pipeline::hash(data, std::strlen(data));
    EXPECT_EQ(std::memcmp(out, expected.data(), 16), 0);
}
