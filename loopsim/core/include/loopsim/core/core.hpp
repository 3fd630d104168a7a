#pragma once

/// @defgroup core Core Library
/// @brief Virtual clock, message queues, thread-bound loops and teardown.
///
/// The core library provides the deterministic loop simulation: a single
/// shared VirtualClock, per-loop time-ordered MessageQueues, thread-bound
/// Loops that only dispatch when driven, the cross-thread IdleCoordinator
/// handoff, and the LoopRegistry used between tests. It has no dependency
/// on scenario files or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for virtual time and durations.

/// @defgroup core_clock Clock
/// @ingroup core
/// @brief Process-wide virtual clock.

/// @defgroup core_messages Messages
/// @ingroup core
/// @brief Messages, dispatch targets, and the ordered message queue.

/// @defgroup core_loops Loops
/// @ingroup core
/// @brief Loop driver interface, loops, loop threads, and the registry.

#include <loopsim/core/types.hpp>
#include <loopsim/core/error.hpp>
#include <loopsim/core/loop_mode.hpp>
#include <loopsim/core/trace_writer.hpp>
#include <loopsim/core/tracing.hpp>
#include <loopsim/core/virtual_clock.hpp>

#include <loopsim/core/message.hpp>
#include <loopsim/core/handler.hpp>
#include <loopsim/core/message_queue.hpp>

#include <loopsim/core/loop_driver.hpp>
#include <loopsim/core/idle_coordinator.hpp>
#include <loopsim/core/loop.hpp>
#include <loopsim/core/loop_thread.hpp>
#include <loopsim/core/loop_registry.hpp>
