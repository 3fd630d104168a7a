#pragma once

/// @defgroup io I/O Library
/// @brief Scenario loading and running, and trace output.
///
/// The I/O library handles everything outside the loop machinery itself:
/// loading JSON scenario files, running them against real loops, and
/// writing the trace records the core emits (JSON, textual, in-memory).
/// Depends on core only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Scenario JSON loader.

/// @defgroup io_runner Runner
/// @ingroup io
/// @brief Scripted execution of a scenario.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, and null trace writers.

#include <loopsim/io/error.hpp>
#include <loopsim/io/trace_writers.hpp>
#include <loopsim/io/scenario_loader.hpp>
#include <loopsim/io/scenario_runner.hpp>
