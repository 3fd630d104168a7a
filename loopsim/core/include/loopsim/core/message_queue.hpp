#pragma once

#include <loopsim/core/message.hpp>
#include <loopsim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace loopsim::core {

class Handler;
class VirtualClock;

/// @brief Time-ordered set of pending messages for one loop.
///
/// Messages are kept in an ordered map keyed by MessageKey (lane, time,
/// sequence), the same structure the simulation engine uses for its event
/// queue. A message is *due* when it sits in the front lane or its
/// scheduled time is at or before the clock's current time; the queue is
/// *idle* when its head is not due. Idle detection never blocks and never
/// moves the clock.
///
/// Admission is open to every thread; removal for dispatch is reserved to
/// the owning loop's thread (the Loop enforces this).
///
/// @see Loop, IdleCoordinator, MessageKey
/// @ingroup core_messages
class MessageQueue {
public:
    /// @brief Construct an empty queue.
    /// @param quit_allowed Whether teardown may discard the owning loop.
    /// @param clock        Clock used to decide which messages are due.
    /// @param name         Diagnostic name (the owning loop's name).
    MessageQueue(bool quit_allowed, VirtualClock& clock, std::string name = {});

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;
    MessageQueue(MessageQueue&&) = delete;
    MessageQueue& operator=(MessageQueue&&) = delete;

    /// @brief Admit a message.
    ///
    /// Timed messages are ordered by @c message.when then by admission
    /// order. With @p at_front the message goes ahead of every pending
    /// timed message, after front messages admitted earlier, and its
    /// @c when is set to the epoch so it reports as the earliest pending.
    ///
    /// @param message Message to admit; its sequence number is assigned here.
    /// @param at_front Place the message in the front lane.
    /// @return False, with a warning record, if the queue has quit.
    bool enqueue(Message message, bool at_front = false);

    /// @brief Remove and return the head message if it is due.
    /// @return The head message, or nullopt if the queue is idle.
    std::optional<Message> poll_ready();

    /// @brief Remove and return the head message, which must be due.
    /// @throws InvalidStateError if the queue is idle.
    Message next_ready();

    /// @brief Returns true if no pending message is due at the current time.
    [[nodiscard]] bool is_idle() const;

    /// @brief Returns the teardown policy fixed at construction.
    [[nodiscard]] bool is_quit_allowed() const noexcept { return quit_allowed_; }

    /// @brief Returns true once quit() has been called.
    [[nodiscard]] bool is_quitting() const;

    /// @brief Discard all pending messages, keeping the queue usable.
    void reset();

    /// @brief Stop admitting messages and discard the pending ones.
    ///
    /// Idempotent.
    ///
    /// @throws InvalidStateError if the queue is not quit-allowed.
    void quit();

    /// @brief Scheduled time of the next message to dispatch.
    /// @return nullopt when the queue is empty.
    [[nodiscard]] std::optional<TimePoint> next_scheduled_time() const;

    /// @brief Scheduled time of the last message to dispatch.
    /// @return nullopt when the queue is empty.
    [[nodiscard]] std::optional<TimePoint> last_scheduled_time() const;

    /// @brief Remove pending messages addressed to @p target.
    /// @param target Handler the messages were sent through.
    /// @param what   Only remove messages with this code; all when empty.
    /// @return Number of messages removed.
    std::size_t remove_messages(const Handler& target, std::optional<int> what = std::nullopt);

    /// @brief Returns true if a message addressed to @p target is pending.
    [[nodiscard]] bool has_messages(const Handler& target,
                                    std::optional<int> what = std::nullopt) const;

    /// @brief Number of pending messages.
    [[nodiscard]] std::size_t size() const;

    /// @brief Returns true if nothing is pending.
    [[nodiscard]] bool empty() const;

    /// @brief The clock this queue reads.
    [[nodiscard]] VirtualClock& clock() const noexcept { return clock_; }

    /// @brief Diagnostic name.
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    using Map = std::map<MessageKey, Message>;

    [[nodiscard]] bool head_due_locked() const;
    Message take_head_locked();

    const bool quit_allowed_;
    VirtualClock& clock_; // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::string name_;

    mutable std::mutex mutex_;
    Map messages_;
    uint64_t sequence_{0};
    bool quitting_{false};
};

} // namespace loopsim::core
