#pragma once

#include <loopsim/core/loop_mode.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace loopsim::core {

/// @brief Base exception for all loop simulation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch simulator errors separately from other
/// `std::runtime_error` exceptions.
///
/// @see UnsupportedInModeError, WrongThreadError, InvalidStateError, OutOfRangeError
/// @ingroup core
class LoopSimError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown by driver operations that only exist in another scheduling mode.
///
/// The shared-clock paused mode refuses the operations of the legacy
/// per-loop-clock model, such as unpausing or fetching a legacy scheduler.
///
/// @see LoopMode, LoopDriver
/// @ingroup core
class UnsupportedInModeError : public LoopSimError {
public:
    /// @brief Construct the error for @p operation refused in @p mode.
    /// @param operation Name of the refused driver operation.
    /// @param mode      Scheduling mode that refuses it.
    UnsupportedInModeError(std::string_view operation, LoopMode mode)
        : LoopSimError(std::string(operation) + " is not supported in "
                       + std::string(loop_mode_name(mode)) + " scheduling mode")
        , mode_(mode) {}

    /// @brief Scheduling mode that refused the operation.
    [[nodiscard]] LoopMode mode() const noexcept { return mode_; }

private:
    LoopMode mode_;
};

/// @brief Thrown when an operation is invoked from, or on, the wrong thread or loop.
///
/// For example, idling the main loop from a thread other than the one it
/// is bound to, or calling Loop::run_paused() on a non-main loop.
///
/// @see Loop::idle, Loop::run_paused, Loop::pause
/// @ingroup core
class WrongThreadError : public LoopSimError {
public:
    using LoopSimError::LoopSimError;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, taking the next ready message from an idle queue, or
/// preparing a second main loop.
///
/// @see LoopSimError
/// @ingroup core
class InvalidStateError : public LoopSimError {
public:
    using LoopSimError::LoopSimError;
};

/// @brief Thrown when a value is outside its valid range.
///
/// For example, advancing the virtual clock by a negative duration.
///
/// @see VirtualClock::advance_by
/// @ingroup core
class OutOfRangeError : public LoopSimError {
public:
    using LoopSimError::LoopSimError;
};

} // namespace loopsim::core
