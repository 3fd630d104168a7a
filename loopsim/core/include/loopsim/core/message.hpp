#pragma once

#include <loopsim/core/types.hpp>

#include <any>
#include <compare>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace loopsim::core {

class Handler;
class VirtualClock;

/// @brief Named constants for the admission lane of a message.
///
/// Front-lane messages are ordered ahead of every timed message regardless
/// of their scheduled time, and are always due. Within a lane, messages are
/// ordered by time then by insertion sequence.
///
/// @see MessageKey, MessageQueue::enqueue
/// @ingroup core_messages
struct MessageLane {
    static constexpr int FRONT = 0; ///< Urgent work posted at the front of the queue.
    static constexpr int TIMED = 1; ///< Regular work, ordered by scheduled time.
};

/// @brief Deterministic ordering key for messages in a queue.
///
/// Messages are ordered first by lane (front before timed), then by
/// scheduled time, then by insertion sequence number so that messages
/// scheduled for the same instant dispatch in FIFO order.
///
/// @see MessageLane, MessageQueue
/// @ingroup core_messages
struct MessageKey {
    int lane;          ///< Primary: MessageLane::FRONT or MessageLane::TIMED.
    TimePoint when;    ///< Secondary: scheduled execution time.
    uint64_t sequence; ///< Tertiary: insertion order for determinism.

    /// @cond INTERNAL
    auto operator<=>(const MessageKey&) const = default;
    /// @endcond
};

/// @brief A unit of work pending on a loop.
///
/// The payload is an integer @c what code, an optional type-erased object
/// and an optional callback. When dispatched, a message with a callback
/// runs the callback; otherwise its target's Handler::handle_message() is
/// invoked. The core never looks at the payload.
///
/// A Message is owned by the MessageQueue holding it until it is removed
/// for dispatch, at which point ownership moves to dispatch_message().
///
/// @see Handler, MessageQueue, dispatch_message
/// @ingroup core_messages
struct Message {
    int what{0};                     ///< User-defined message code.
    std::any payload;                ///< Optional user object.
    std::function<void()> callback;  ///< Runs instead of handle_message() when set.
    std::shared_ptr<Handler> target; ///< Dispatch target; may be null for bare callbacks.
    std::string tag;                 ///< Diagnostic label copied into trace records.
    TimePoint when{};                ///< Scheduled execution time.
    uint64_t sequence{0};            ///< Assigned by the queue on admission.
};

/// @brief Dispatch a message removed from a queue.
///
/// Raises @p clock to the message's scheduled time, records a `dispatch`
/// trace, then hands the message to its target (or runs its bare
/// callback). The message and the resources it holds are released when
/// this call returns.
///
/// @param message Message taken from the queue.
/// @param clock   Clock the owning queue reads.
void dispatch_message(Message message, VirtualClock& clock);

} // namespace loopsim::core
