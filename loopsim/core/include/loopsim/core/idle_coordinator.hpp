#pragma once

#include <cstddef>
#include <future>
#include <limits>
#include <string_view>

namespace loopsim::core {

class MessageQueue;

/// @brief One-shot drain of a queue, with a completion signal for a waiter.
/// @ingroup core_loops
///
/// An IdleCoordinator is created per idle request. drain() dispatches due
/// messages until the queue is idle (or the dispatch limit is reached);
/// run() does the same and then fires the completion signal exactly once,
/// carrying any exception a dispatched message threw.
///
/// For a cross-thread request, the requesting thread takes completion()
/// first, hands the coordinator over to the loop's bound thread, and then
/// only ever waits on the future: it never touches the queue. If the
/// coordinator is destroyed without having run (the loop quit first), the
/// future reports a broken promise, which wait_till_idle() turns into a
/// warning.
///
/// @see Loop::idle, Loop::run_one_task
class IdleCoordinator {
public:
    /// @brief Dispatch limit meaning "until the queue is idle".
    static constexpr std::size_t UNBOUNDED = std::numeric_limits<std::size_t>::max();

    /// @brief Create a coordinator draining @p queue.
    /// @param queue Queue to drain; must outlive run()/drain().
    /// @param dispatch_limit Maximum number of messages to dispatch.
    explicit IdleCoordinator(MessageQueue& queue, std::size_t dispatch_limit = UNBOUNDED);

    IdleCoordinator(const IdleCoordinator&) = delete;
    IdleCoordinator& operator=(const IdleCoordinator&) = delete;

    /// @brief Waiter end of the completion signal. May be called once.
    [[nodiscard]] std::future<void> completion();

    /// @brief Dispatch due messages until idle or the limit is reached.
    ///
    /// Re-checks idleness after every dispatch, so messages made due by a
    /// dispatch (zero-delay posts) are part of the same drain. Exceptions
    /// from dispatched messages propagate.
    ///
    /// @return Number of messages dispatched by this call.
    std::size_t drain();

    /// @brief drain(), then fire the completion signal.
    ///
    /// Never throws: an exception from drain() is stored in the signal.
    void run() noexcept;

    /// @brief Total number of messages dispatched so far.
    [[nodiscard]] std::size_t dispatched() const noexcept { return dispatched_; }

    /// @brief Block until @p completion fires.
    ///
    /// Rethrows an exception stored by run(). An abandoned signal (the
    /// coordinator was dropped before running) is reported as a warning
    /// record for @p loop_name and ends the wait normally.
    static void wait_till_idle(std::future<void>& completion, std::string_view loop_name);

private:
    MessageQueue& queue_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::size_t dispatch_limit_;
    std::size_t dispatched_{0};
    std::promise<void> done_;
};

} // namespace loopsim::core
