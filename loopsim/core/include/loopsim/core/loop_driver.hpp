#pragma once

#include <loopsim/core/loop_mode.hpp>
#include <loopsim/core/types.hpp>

#include <chrono>
#include <functional>
#include <optional>

namespace loopsim::core {

/// @brief Opaque per-loop scheduler of the legacy scheduling mode.
///
/// Only named so that LoopDriver::scheduler() can declare the legacy
/// operation; no implementation exists in this library.
class LegacyScheduler;

/// @brief Test-facing control surface of a loop.
///
/// This is the seam through which a platform-facing message loop is driven
/// by test code: posting work, draining what is due, single-stepping, and
/// the pause controls. It covers both scheduling models; an implementation
/// refuses the operations of the model it does not implement by throwing
/// UnsupportedInModeError.
///
/// @see Loop
/// @ingroup core_loops
class LoopDriver {
public:
    virtual ~LoopDriver() = default;

    /// @brief Scheduling model implemented by this driver.
    [[nodiscard]] virtual LoopMode mode() const noexcept = 0;

    /// @name Dispatch control
    /// @{

    /// @brief Run every message that is due at the current virtual time.
    virtual void idle() = 0;

    /// @brief Advance the virtual clock by @p d, then idle().
    virtual void idle_for(Duration d) = 0;

    /// @brief idle_for() taking a `std::chrono` duration.
    template<typename Rep, typename Period>
    void idle_for(std::chrono::duration<Rep, Period> d) {
        idle_for(duration_from_chrono(d));
    }

    /// @brief idle() if the loop is paused.
    virtual void idle_if_paused() = 0;

    /// @brief Returns true if no message is due at the current virtual time.
    [[nodiscard]] virtual bool is_idle() const = 0;

    /// @brief Run at most one due message.
    virtual void run_one_task() = 0;

    /// @brief Run @p task with the loop paused, then drain what is due.
    virtual void run_paused(const std::function<void()>& task) = 0;

    /// @}

    /// @name Posting
    /// @{

    /// @brief Post @p task to run @p delay after the current virtual time.
    virtual bool post(std::function<void()> task, Duration delay) = 0;

    /// @brief Post @p task ahead of every pending message.
    virtual bool post_at_front(std::function<void()> task) = 0;

    /// @}

    /// @name Pause state
    /// @{

    virtual void pause() = 0;
    virtual void unpause() = 0;
    [[nodiscard]] virtual bool is_paused() const = 0;
    virtual bool set_paused(bool paused) = 0;
    virtual void idle_constantly(bool enabled) = 0;

    /// @}

    /// @name Diagnostics
    /// @{

    [[nodiscard]] virtual std::optional<TimePoint> next_scheduled_time() const = 0;
    [[nodiscard]] virtual std::optional<TimePoint> last_scheduled_time() const = 0;

    /// @}

    /// @name Legacy scheduling operations
    /// @{

    virtual void quit_unchecked() = 0;
    [[nodiscard]] virtual bool has_quit() const = 0;
    virtual void reset_scheduler() = 0;
    virtual void reset() = 0;
    virtual LegacyScheduler& scheduler() = 0;

    /// @}

protected:
    LoopDriver() = default;
    LoopDriver(const LoopDriver&) = default;
    LoopDriver& operator=(const LoopDriver&) = default;
    LoopDriver(LoopDriver&&) = default;
    LoopDriver& operator=(LoopDriver&&) = default;
};

} // namespace loopsim::core
