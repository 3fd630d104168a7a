#pragma once

/// @file scenario_runner.hpp
/// @brief Executes a loaded scenario against real loops.
/// @ingroup io_runner

#include <loopsim/core/types.hpp>
#include <loopsim/io/scenario_loader.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace loopsim::io {

/// @brief Pending message count of one scenario loop after the run.
/// @ingroup io_runner
struct LoopPending {
    std::string name;      ///< Scenario loop name.
    std::size_t pending{0};
};

/// @brief Result of run_scenario().
/// @ingroup io_runner
struct RunSummary {
    uint64_t dispatched{0};           ///< Scenario messages dispatched.
    uint64_t rejected{0};             ///< Posts refused because the loop had quit.
    core::TimePoint final_time{};     ///< Virtual clock value after the last step.
    std::vector<LoopPending> pending; ///< Per loop, in declaration order.
};

/// @brief Run @p scenario on the calling thread.
///
/// Resets the global virtual clock to the scenario start time, binds the
/// loop marked @c main to the process main loop (preparing it on the
/// calling thread if needed) and starts a LoopThread for every other loop.
/// Steps then run in order as driver calls from the calling thread; idling
/// a worker loop is therefore a cross-thread handoff.
///
/// Each posted message carries its label as the dispatch tag. A message
/// with a repeat count re-posts itself from inside its own dispatch.
///
/// Worker loops are quit when the run ends. Messages still pending on the
/// main loop stay queued until the next teardown.
///
/// @return Counts and pending messages at the end of the run.
///
/// @throws ScenarioError  If a step names an unknown loop, the main loop is
///                        bound to another thread, or a loop refuses a step.
RunSummary run_scenario(const ScenarioData& scenario);

} // namespace loopsim::io
