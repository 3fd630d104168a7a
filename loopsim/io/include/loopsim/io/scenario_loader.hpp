#pragma once

/// @file scenario_loader.hpp
/// @brief Data structures and loader for JSON loop scenarios.
/// @ingroup io_loaders

#include <loopsim/core/types.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace loopsim::io {

/// @brief A loop declared by a scenario.
///
/// @ingroup io_loaders
/// @see ScenarioData
struct LoopSpec {
    std::string name;  ///< Name steps use to address the loop.
    bool main{false};  ///< Bind to the process main loop instead of a LoopThread.
};

/// @brief Driver call performed by a scenario step.
/// @ingroup io_loaders
enum class StepOp {
    Post,        ///< Post a labelled message, optionally repeating.
    PostAtFront, ///< Post a labelled message ahead of every pending one.
    Advance,     ///< Advance the virtual clock without dispatching.
    Idle,        ///< Drain what is due on one loop.
    IdleFor,     ///< Advance the clock, then drain one loop.
    RunOneTask,  ///< Dispatch at most one due message on one loop.
    Teardown     ///< Registry teardown of every loop.
};

/// @brief Returns the JSON spelling of @p op ("post", "idle_for"...).
[[nodiscard]] std::string_view step_op_name(StepOp op) noexcept;

/// @brief One scripted driver call.
///
/// Only the fields relevant to @c op are meaningful.
///
/// @ingroup io_loaders
/// @see StepOp, ScenarioData
struct StepSpec {
    StepOp op{StepOp::Idle};
    std::string loop;                ///< Target loop (all ops but Advance and Teardown).
    std::string label;               ///< Message label, traced as the dispatch tag.
    core::Duration delay{};          ///< Post delay (`delay_ms`).
    core::Duration repeat_every{};   ///< Re-post interval (`repeat_every_ms`).
    uint64_t repeat_count{0};        ///< Number of re-posts (`repeat_count`).
    core::Duration amount{};         ///< Advance (`by_ms`) or idle_for (`duration_ms`).
};

/// @brief Complete scenario: loops to create and the steps that drive them.
///
/// @ingroup io_loaders
/// @see load_scenario, run_scenario
struct ScenarioData {
    core::TimePoint start_time{};    ///< Virtual clock value when the run starts.
    std::vector<LoopSpec> loops;     ///< Loops, in declaration order.
    std::vector<StepSpec> steps;     ///< Steps, in execution order.
};

/// @brief Load a scenario from a JSON file.
///
/// @param path  Filesystem path to the JSON scenario file.
/// @return Parsed scenario data.
///
/// @throws LoaderError  If the file cannot be read or contains invalid JSON.
///
/// @see load_scenario_from_string
ScenarioData load_scenario(const std::filesystem::path& path);

/// @brief Load a scenario from a JSON string.
///
/// Validates the document shape: loop names are unique and non-empty, at
/// most one loop is the main loop, every step has a known @c op with its
/// required fields, and clock amounts are non-negative. Whether a step's
/// loop exists is checked when the scenario runs.
///
/// @param json  JSON content describing the scenario.
/// @return Parsed scenario data.
///
/// @throws LoaderError  If the JSON is malformed or fails validation.
ScenarioData load_scenario_from_string(std::string_view json);

} // namespace loopsim::io
