#pragma once

#include <loopsim/core/types.hpp>

#include <atomic>
#include <cstdint>

namespace loopsim::core {

/// @brief Process-wide simulated time shared by every loop.
///
/// The clock holds a single millisecond instant in an atomic, so it can be
/// read from any thread without locking. It only moves through explicit
/// calls: advance_by() from the driver and set_absolute() from the dispatch
/// step. Neither can make it go backwards; reset() is the one lifecycle
/// operation allowed to, and is reserved for test boundaries.
///
/// Loops and queues use global() unless a test hands them a private clock.
///
/// @see MessageQueue, Loop::idle_for
/// @ingroup core_clock
class VirtualClock {
public:
    /// @brief Construct a clock starting at @p start.
    explicit VirtualClock(TimePoint start = TimePoint::epoch()) noexcept;

    VirtualClock(const VirtualClock&) = delete;
    VirtualClock& operator=(const VirtualClock&) = delete;

    /// @brief The clock shared by every loop in the process.
    [[nodiscard]] static VirtualClock& global() noexcept;

    /// @brief Returns the current virtual time.
    [[nodiscard]] TimePoint now() const noexcept;

    /// @brief Move the clock forward by @p d.
    /// @param d Non-negative interval to add.
    /// @return The new current time.
    /// @throws OutOfRangeError if @p d is negative or the result would not
    ///         be representable; the clock is left unchanged.
    TimePoint advance_by(Duration d);

    /// @brief Raise the clock to @p instant.
    ///
    /// Used by the dispatch step to align time with the message about to
    /// run. An instant earlier than now() leaves the clock untouched.
    ///
    /// @param instant Target time.
    /// @return True if the clock value changed.
    bool set_absolute(TimePoint instant) noexcept;

    /// @brief Put the clock back to @p start.
    ///
    /// Lifecycle operation for process start and test boundaries; it is the
    /// only call that may lower the clock.
    void reset(TimePoint start = TimePoint::epoch()) noexcept;

private:
    std::atomic<int64_t> now_ms_;
};

} // namespace loopsim::core
