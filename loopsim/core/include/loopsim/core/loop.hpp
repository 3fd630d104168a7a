#pragma once

#include <loopsim/core/loop_driver.hpp>
#include <loopsim/core/message_queue.hpp>
#include <loopsim/core/types.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace loopsim::core {

class Handler;
class VirtualClock;

/// @brief Thread-bound message loop running on the shared virtual clock.
///
/// A Loop owns exactly one MessageQueue and is bound, at construction, to
/// the thread that created it; every message it holds is dispatched on
/// that thread. Loops are always paused: nothing runs until the driver
/// calls idle(), idle_for() or run_one_task(). When those are invoked from
/// a foreign thread the work is handed to the bound thread through an
/// IdleCoordinator and the caller blocks until it completes.
///
/// One loop per process is the *main* loop. It is not quit-allowed (it is
/// reset between tests instead of discarded) and it only accepts
/// idle/run requests from its own thread.
///
/// Loops are created through prepare() or prepare_main_loop(), or by a
/// LoopThread, and are tracked by the LoopRegistry from creation until
/// teardown.
///
/// @code
/// auto main = Loop::prepare_main_loop();
/// main->post([] { ... }, duration_from_millis(10));
/// main->idle_for(duration_from_millis(10));
/// @endcode
///
/// @see LoopDriver, LoopThread, LoopRegistry, VirtualClock
/// @ingroup core_loops
class Loop final : public LoopDriver, public std::enable_shared_from_this<Loop> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// @brief Construct a loop bound to the calling thread (factory use only).
    Loop(PrivateTag, bool quit_allowed, bool is_main, std::string name, VirtualClock& clock);

    Loop(const Loop&) = delete;
    Loop& operator=(const Loop&) = delete;
    Loop(Loop&&) = delete;
    Loop& operator=(Loop&&) = delete;

    /// @name Creation
    /// @{

    /// @brief Create a loop bound to the calling thread.
    /// @param quit_allowed Whether teardown discards the loop (true) or resets it.
    /// @param name Diagnostic name; generated when empty.
    /// @throws InvalidStateError if a live loop is already bound to this thread.
    static std::shared_ptr<Loop> prepare(bool quit_allowed = true, std::string name = {});

    /// @brief Create the process main loop, bound to the calling thread.
    /// @throws InvalidStateError if the main loop already exists, or if a
    ///         live loop is already bound to this thread.
    static std::shared_ptr<Loop> prepare_main_loop();

    /// @brief Returns the main loop, or nullptr before prepare_main_loop().
    [[nodiscard]] static std::shared_ptr<Loop> main_loop() noexcept;

    /// @brief Returns the loop bound to the calling thread, or nullptr.
    [[nodiscard]] static std::shared_ptr<Loop> current() noexcept;

    /// @}

    /// @name LoopDriver
    /// @{

    [[nodiscard]] LoopMode mode() const noexcept override { return LoopMode::Paused; }

    /// @brief Run every message due at the current virtual time.
    ///
    /// On the bound thread the drain runs in place. From a foreign thread
    /// the drain is handed to the bound thread and this call blocks until
    /// it finishes; an exception thrown by a dispatched message is rethrown
    /// here. If the loop quits before the handoff runs, the wait ends with a
    /// warning record.
    ///
    /// @throws WrongThreadError if called on the main loop from a foreign thread.
    void idle() override;

    /// @brief Advance the virtual clock by @p d, then idle().
    ///
    /// Messages posted during the drain that fall within the advanced time
    /// also run; later ones stay pending.
    ///
    /// @throws WrongThreadError if called on the main loop from a foreign
    ///         thread (the clock is left untouched).
    /// @throws OutOfRangeError if @p d is negative or would overflow the clock.
    void idle_for(Duration d) override;
    using LoopDriver::idle_for;

    void idle_if_paused() override { idle(); }

    [[nodiscard]] bool is_idle() const override;

    /// @brief Dispatch at most one due message.
    ///
    /// The clock is raised to the message's scheduled time before dispatch.
    /// From a foreign thread the step is handed to the bound thread.
    ///
    /// @throws WrongThreadError if called on the main loop from a foreign thread.
    void run_one_task() override;

    /// @brief Run @p task immediately, then idle(). Main loop only.
    /// @throws WrongThreadError on a non-main loop, or from a foreign thread.
    void run_paused(const std::function<void()>& task) override;

    bool post(std::function<void()> task, Duration delay = Duration::zero()) override;
    bool post_at_front(std::function<void()> task) override;

    /// @brief No-op: the main loop is always paused.
    /// @throws WrongThreadError on a non-main loop.
    void pause() override;

    void unpause() override;
    [[nodiscard]] bool is_paused() const override { return true; }

    /// @brief Accepts `true` (already paused); refuses `false`.
    bool set_paused(bool paused) override;

    void idle_constantly(bool enabled) override;

    [[nodiscard]] std::optional<TimePoint> next_scheduled_time() const override;
    [[nodiscard]] std::optional<TimePoint> last_scheduled_time() const override;

    void quit_unchecked() override;
    [[nodiscard]] bool has_quit() const override;
    void reset_scheduler() override;
    void reset() override;
    LegacyScheduler& scheduler() override;

    /// @}

    /// @name Platform side
    /// @{

    /// @brief Service cross-thread handoffs until the loop quits.
    ///
    /// Must be called on the bound thread. Pending messages are not
    /// dispatched here: the loop stays paused and only runs the drains that
    /// foreign threads request.
    ///
    /// @throws WrongThreadError if called from another thread.
    /// @throws InvalidStateError on the main loop.
    void loop();

    /// @brief Discard pending work and stop accepting messages.
    ///
    /// This is the teardown path for quit-allowed loops. Handoffs that have
    /// not run yet are abandoned and a thread blocked in loop() returns.
    /// Idempotent.
    ///
    /// @throws InvalidStateError on a loop that is not quit-allowed.
    void quit();

    [[nodiscard]] bool is_main() const noexcept { return is_main_; }
    [[nodiscard]] bool is_quit_allowed() const noexcept { return queue_.is_quit_allowed(); }
    [[nodiscard]] bool is_quitting() const { return queue_.is_quitting(); }
    [[nodiscard]] std::thread::id thread_id() const noexcept { return thread_id_; }
    [[nodiscard]] bool is_current_thread() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] MessageQueue& queue() noexcept { return queue_; }
    [[nodiscard]] const MessageQueue& queue() const noexcept { return queue_; }

    /// @brief Default dispatch target used by post() and post_at_front().
    [[nodiscard]] const std::shared_ptr<Handler>& handler() const noexcept { return handler_; }

    /// @}

private:
    static std::shared_ptr<Loop> create(bool quit_allowed, bool is_main, std::string name);

    bool hand_off(std::function<void()> work);
    void hand_off_and_wait(std::size_t dispatch_limit);
    void check_foreign_driver_call(std::string_view operation) const;
    void require_main(std::string_view operation) const;

    const bool is_main_;
    const std::string name_;
    const std::thread::id thread_id_;
    MessageQueue queue_;
    std::shared_ptr<Handler> handler_;

    std::mutex handoff_mutex_;
    std::condition_variable handoff_cv_;
    std::deque<std::function<void()>> handoff_;
    bool handoff_closed_{false};
};

} // namespace loopsim::core
