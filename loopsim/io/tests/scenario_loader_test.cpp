#include <loopsim/io/scenario_loader.hpp>
#include <loopsim/io/error.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace loopsim::io;
using namespace loopsim::core;

class ScenarioLoaderTest : public ::testing::Test {};

// =============================================================================
// Valid scenarios
// =============================================================================

TEST_F(ScenarioLoaderTest, LoadFullScenario) {
    const char* json = R"({
        "start_time_ms": 100,
        "loops": [
            {"name": "main", "main": true},
            {"name": "worker"}
        ],
        "steps": [
            {"op": "post", "loop": "main", "label": "a", "delay_ms": 10,
             "repeat_every_ms": 5, "repeat_count": 3},
            {"op": "post_at_front", "loop": "worker", "label": "b"},
            {"op": "advance", "by_ms": 5},
            {"op": "idle", "loop": "main"},
            {"op": "idle_for", "loop": "main", "duration_ms": 20},
            {"op": "run_one_task", "loop": "worker"},
            {"op": "teardown"}
        ]
    })";

    auto scenario = load_scenario_from_string(json);

    EXPECT_EQ(scenario.start_time, time_from_millis(100));

    ASSERT_EQ(scenario.loops.size(), 2u);
    EXPECT_EQ(scenario.loops[0].name, "main");
    EXPECT_TRUE(scenario.loops[0].main);
    EXPECT_EQ(scenario.loops[1].name, "worker");
    EXPECT_FALSE(scenario.loops[1].main);

    ASSERT_EQ(scenario.steps.size(), 7u);

    const auto& post = scenario.steps[0];
    EXPECT_EQ(post.op, StepOp::Post);
    EXPECT_EQ(post.loop, "main");
    EXPECT_EQ(post.label, "a");
    EXPECT_EQ(post.delay, duration_from_millis(10));
    EXPECT_EQ(post.repeat_every, duration_from_millis(5));
    EXPECT_EQ(post.repeat_count, 3u);

    EXPECT_EQ(scenario.steps[1].op, StepOp::PostAtFront);
    EXPECT_EQ(scenario.steps[1].label, "b");

    EXPECT_EQ(scenario.steps[2].op, StepOp::Advance);
    EXPECT_EQ(scenario.steps[2].amount, duration_from_millis(5));

    EXPECT_EQ(scenario.steps[3].op, StepOp::Idle);

    EXPECT_EQ(scenario.steps[4].op, StepOp::IdleFor);
    EXPECT_EQ(scenario.steps[4].amount, duration_from_millis(20));

    EXPECT_EQ(scenario.steps[5].op, StepOp::RunOneTask);
    EXPECT_EQ(scenario.steps[5].loop, "worker");

    EXPECT_EQ(scenario.steps[6].op, StepOp::Teardown);
}

TEST_F(ScenarioLoaderTest, DefaultsApply) {
    auto scenario = load_scenario_from_string(R"({
        "loops": [{"name": "main", "main": true}],
        "steps": [{"op": "post", "loop": "main", "label": "x"}]
    })");

    EXPECT_EQ(scenario.start_time, TimePoint::epoch());
    ASSERT_EQ(scenario.steps.size(), 1u);
    EXPECT_EQ(scenario.steps[0].delay, Duration::zero());
    EXPECT_EQ(scenario.steps[0].repeat_count, 0u);
}

TEST_F(ScenarioLoaderTest, StepsAreOptional) {
    auto scenario = load_scenario_from_string(R"({"loops": []})");
    EXPECT_TRUE(scenario.loops.empty());
    EXPECT_TRUE(scenario.steps.empty());
}

TEST_F(ScenarioLoaderTest, NegativePostDelayAccepted) {
    auto scenario = load_scenario_from_string(R"({
        "loops": [{"name": "w"}],
        "steps": [{"op": "post", "loop": "w", "label": "x", "delay_ms": -5}]
    })");
    EXPECT_EQ(scenario.steps[0].delay, duration_from_millis(-5));
}

TEST_F(ScenarioLoaderTest, StepOpNames) {
    EXPECT_EQ(step_op_name(StepOp::Post), "post");
    EXPECT_EQ(step_op_name(StepOp::IdleFor), "idle_for");
    EXPECT_EQ(step_op_name(StepOp::Teardown), "teardown");
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(ScenarioLoaderTest, MalformedJson) {
    EXPECT_THROW(load_scenario_from_string("{not json"), LoaderError);
}

TEST_F(ScenarioLoaderTest, RootMustBeObject) {
    EXPECT_THROW(load_scenario_from_string("[]"), LoaderError);
}

TEST_F(ScenarioLoaderTest, LoopsRequired) {
    EXPECT_THROW(load_scenario_from_string(R"({"steps": []})"), LoaderError);
}

TEST_F(ScenarioLoaderTest, DuplicateLoopName) {
    EXPECT_THROW(load_scenario_from_string(R"({
        "loops": [{"name": "w"}, {"name": "w"}]
    })"), LoaderError);
}

TEST_F(ScenarioLoaderTest, EmptyLoopName) {
    EXPECT_THROW(load_scenario_from_string(R"({"loops": [{"name": ""}]})"), LoaderError);
}

TEST_F(ScenarioLoaderTest, SecondMainLoop) {
    EXPECT_THROW(load_scenario_from_string(R"({
        "loops": [{"name": "a", "main": true}, {"name": "b", "main": true}]
    })"), LoaderError);
}

TEST_F(ScenarioLoaderTest, UnknownOp) {
    EXPECT_THROW(load_scenario_from_string(R"({
        "loops": [],
        "steps": [{"op": "explode"}]
    })"), LoaderError);
}

TEST_F(ScenarioLoaderTest, MissingRequiredStepField) {
    EXPECT_THROW(load_scenario_from_string(R"({
        "loops": [{"name": "w"}],
        "steps": [{"op": "post", "loop": "w"}]
    })"), LoaderError);
}

TEST_F(ScenarioLoaderTest, NegativeAdvanceRejected) {
    EXPECT_THROW(load_scenario_from_string(R"({
        "loops": [],
        "steps": [{"op": "advance", "by_ms": -1}]
    })"), LoaderError);
}

TEST_F(ScenarioLoaderTest, RepeatNeedsInterval) {
    EXPECT_THROW(load_scenario_from_string(R"({
        "loops": [{"name": "w"}],
        "steps": [{"op": "post", "loop": "w", "label": "x", "repeat_count": 2}]
    })"), LoaderError);
}

TEST_F(ScenarioLoaderTest, ErrorMessageCarriesContext) {
    try {
        load_scenario_from_string(R"({
            "loops": [{"name": "w"}],
            "steps": [{"op": "idle_for", "loop": "w"}]
        })");
        FAIL() << "expected LoaderError";
    } catch (const LoaderError& e) {
        EXPECT_EQ(std::string(e.what()), "steps[0]: missing required field 'duration_ms'");
    }
}

// =============================================================================
// Files
// =============================================================================

TEST_F(ScenarioLoaderTest, MissingFile) {
    EXPECT_THROW(load_scenario("/nonexistent/scenario.json"), LoaderError);
}

TEST_F(ScenarioLoaderTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "loopsim_loader_test.json";
    {
        std::ofstream out(path);
        out << R"({"start_time_ms": 7, "loops": [{"name": "w"}]})";
    }

    auto scenario = load_scenario(path);
    std::filesystem::remove(path);

    EXPECT_EQ(scenario.start_time, time_from_millis(7));
    ASSERT_EQ(scenario.loops.size(), 1u);
}
