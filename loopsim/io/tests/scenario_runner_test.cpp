#include <loopsim/io/error.hpp>
#include <loopsim/io/scenario_loader.hpp>
#include <loopsim/io/scenario_runner.hpp>
#include <loopsim/io/trace_writers.hpp>

#include <loopsim/core/loop.hpp>
#include <loopsim/core/loop_registry.hpp>
#include <loopsim/core/tracing.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace loopsim::io;
using namespace loopsim::core;

class ScenarioRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!Loop::main_loop()) {
            Loop::prepare_main_loop();
        }
        set_trace_writer(&writer_);
    }

    void TearDown() override {
        set_trace_writer(nullptr);
        reset_after_test();
    }

    RunSummary run(const char* json) {
        return run_scenario(load_scenario_from_string(json));
    }

    std::vector<std::string> dispatched_tags() const {
        std::vector<std::string> tags;
        for (const auto& record : writer_.records_of_type("dispatch")) {
            tags.push_back(record.string_field("tag").value_or(""));
        }
        return tags;
    }

    std::vector<uint64_t> dispatched_when() const {
        std::vector<uint64_t> when;
        for (const auto& record : writer_.records_of_type("dispatch")) {
            when.push_back(record.uint_field("when_ms").value_or(0));
        }
        return when;
    }

    MemoryTraceWriter writer_;
};

TEST_F(ScenarioRunnerTest, MainLoopDispatchesByDelay) {
    auto summary = run(R"({
        "loops": [{"name": "main", "main": true}],
        "steps": [
            {"op": "post", "loop": "main", "label": "a", "delay_ms": 10},
            {"op": "post", "loop": "main", "label": "b", "delay_ms": 5},
            {"op": "idle_for", "loop": "main", "duration_ms": 10}
        ]
    })");

    EXPECT_EQ(dispatched_tags(), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(dispatched_when(), (std::vector<uint64_t>{5, 10}));
    EXPECT_EQ(summary.dispatched, 2u);
    EXPECT_EQ(summary.final_time, time_from_millis(10));
    ASSERT_EQ(summary.pending.size(), 1u);
    EXPECT_EQ(summary.pending[0].name, "main");
    EXPECT_EQ(summary.pending[0].pending, 0u);
}

TEST_F(ScenarioRunnerTest, RepeatChainReschedulesItself) {
    auto summary = run(R"({
        "loops": [{"name": "main", "main": true}],
        "steps": [
            {"op": "post", "loop": "main", "label": "tick", "delay_ms": 10,
             "repeat_every_ms": 5, "repeat_count": 3},
            {"op": "idle_for", "loop": "main", "duration_ms": 10},
            {"op": "idle_for", "loop": "main", "duration_ms": 5},
            {"op": "idle_for", "loop": "main", "duration_ms": 5},
            {"op": "idle_for", "loop": "main", "duration_ms": 5},
            {"op": "idle_for", "loop": "main", "duration_ms": 5}
        ]
    })");

    EXPECT_EQ(dispatched_when(), (std::vector<uint64_t>{10, 15, 20, 25}));
    EXPECT_EQ(summary.dispatched, 4u);
    EXPECT_EQ(summary.pending[0].pending, 0u);
}

TEST_F(ScenarioRunnerTest, StartTimeOffsetsSchedule) {
    auto summary = run(R"({
        "start_time_ms": 1000,
        "loops": [{"name": "main", "main": true}],
        "steps": [
            {"op": "post", "loop": "main", "label": "a", "delay_ms": 10},
            {"op": "idle_for", "loop": "main", "duration_ms": 10}
        ]
    })");

    EXPECT_EQ(dispatched_when(), (std::vector<uint64_t>{1010}));
    EXPECT_EQ(summary.final_time, time_from_millis(1010));
}

TEST_F(ScenarioRunnerTest, AdvanceThenIdle) {
    auto summary = run(R"({
        "loops": [{"name": "main", "main": true}],
        "steps": [
            {"op": "post", "loop": "main", "label": "a", "delay_ms": 10},
            {"op": "advance", "by_ms": 9},
            {"op": "idle", "loop": "main"},
            {"op": "advance", "by_ms": 1},
            {"op": "idle", "loop": "main"}
        ]
    })");

    EXPECT_EQ(summary.dispatched, 1u);
    EXPECT_EQ(dispatched_when(), (std::vector<uint64_t>{10}));
}

TEST_F(ScenarioRunnerTest, WorkerLoopRunsOnItsOwnThread) {
    auto summary = run(R"({
        "loops": [{"name": "worker"}],
        "steps": [
            {"op": "post", "loop": "worker", "label": "a"},
            {"op": "post_at_front", "loop": "worker", "label": "b"},
            {"op": "idle", "loop": "worker"}
        ]
    })");

    EXPECT_EQ(dispatched_tags(), (std::vector<std::string>{"b", "a"}));
    for (const auto& record : writer_.records_of_type("dispatch")) {
        EXPECT_EQ(record.string_field("loop"), "worker");
    }
    EXPECT_EQ(summary.dispatched, 2u);
}

TEST_F(ScenarioRunnerTest, RunOneTaskLeavesRestPending) {
    auto summary = run(R"({
        "loops": [{"name": "main", "main": true}, {"name": "worker"}],
        "steps": [
            {"op": "post", "loop": "worker", "label": "a"},
            {"op": "post", "loop": "worker", "label": "b"},
            {"op": "run_one_task", "loop": "worker"}
        ]
    })");

    EXPECT_EQ(dispatched_tags(), (std::vector<std::string>{"a"}));
    ASSERT_EQ(summary.pending.size(), 2u);
    EXPECT_EQ(summary.pending[0].pending, 0u);
    EXPECT_EQ(summary.pending[1].name, "worker");
    EXPECT_EQ(summary.pending[1].pending, 1u);
}

TEST_F(ScenarioRunnerTest, TeardownQuitsWorkers) {
    auto summary = run(R"({
        "loops": [{"name": "main", "main": true}, {"name": "worker"}],
        "steps": [
            {"op": "post", "loop": "worker", "label": "lost", "delay_ms": 5},
            {"op": "post", "loop": "main", "label": "cleared", "delay_ms": 5},
            {"op": "teardown"},
            {"op": "post", "loop": "worker", "label": "rejected"},
            {"op": "idle", "loop": "worker"},
            {"op": "post", "loop": "main", "label": "kept"},
            {"op": "idle", "loop": "main"}
        ]
    })");

    EXPECT_EQ(dispatched_tags(), (std::vector<std::string>{"kept"}));
    EXPECT_EQ(summary.rejected, 1u);
    EXPECT_FALSE(writer_.records_of_type("warning").empty());
    EXPECT_EQ(summary.pending[1].pending, 0u);
}

TEST_F(ScenarioRunnerTest, UnknownLoopIsScenarioError) {
    EXPECT_THROW(run(R"({
        "loops": [{"name": "main", "main": true}],
        "steps": [{"op": "idle", "loop": "nowhere"}]
    })"), ScenarioError);
}

TEST_F(ScenarioRunnerTest, CoreErrorsBecomeScenarioErrors) {
    // Built directly: the loader rejects negative amounts
    ScenarioData scenario;
    scenario.loops.push_back({"main", true});
    StepSpec step;
    step.op = StepOp::IdleFor;
    step.loop = "main";
    step.amount = duration_from_millis(-1);
    scenario.steps.push_back(step);

    try {
        run_scenario(scenario);
        FAIL() << "expected ScenarioError";
    } catch (const ScenarioError& e) {
        EXPECT_NE(std::string(e.what()).find("steps[0] (idle_for)"), std::string::npos);
    }
}
