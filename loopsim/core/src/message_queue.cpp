#include <loopsim/core/message_queue.hpp>
#include <loopsim/core/error.hpp>
#include <loopsim/core/tracing.hpp>
#include <loopsim/core/virtual_clock.hpp>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

#include <utility>

namespace loopsim::core {

MessageQueue::MessageQueue(bool quit_allowed, VirtualClock& clock, std::string name)
    : quit_allowed_(quit_allowed)
    , clock_(clock)
    , name_(std::move(name)) {}

bool MessageQueue::enqueue(Message message, bool at_front) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    {
        std::scoped_lock lock(mutex_);
        if (!quitting_) {
            if (at_front) {
                message.when = TimePoint::epoch();
            }
            MessageKey key{at_front ? MessageLane::FRONT : MessageLane::TIMED,
                           message.when, sequence_++};
            message.sequence = key.sequence;
            messages_.emplace(key, std::move(message));
            return true;
        }
    }
    // Warn outside the lock
    trace_warning(name_, "message sent to a loop that has quit");
    return false;
}

std::optional<Message> MessageQueue::poll_ready() {
    std::scoped_lock lock(mutex_);
    if (!head_due_locked()) {
        return std::nullopt;
    }
    return take_head_locked();
}

Message MessageQueue::next_ready() {
    std::scoped_lock lock(mutex_);
    if (!head_due_locked()) {
        throw InvalidStateError("next_ready() called on an idle queue");
    }
    return take_head_locked();
}

bool MessageQueue::is_idle() const {
    std::scoped_lock lock(mutex_);
    return !head_due_locked();
}

bool MessageQueue::is_quitting() const {
    std::scoped_lock lock(mutex_);
    return quitting_;
}

void MessageQueue::reset() {
    Map discarded;
    {
        std::scoped_lock lock(mutex_);
        discarded.swap(messages_);
    }
    // Message payloads are destroyed here, outside the lock
}

void MessageQueue::quit() {
    if (!quit_allowed_) {
        throw InvalidStateError("Queue '" + name_ + "' is not allowed to quit");
    }
    Map discarded;
    {
        std::scoped_lock lock(mutex_);
        quitting_ = true;
        discarded.swap(messages_);
    }
}

std::optional<TimePoint> MessageQueue::next_scheduled_time() const {
    std::scoped_lock lock(mutex_);
    if (messages_.empty()) {
        return std::nullopt;
    }
    return messages_.begin()->first.when;
}

std::optional<TimePoint> MessageQueue::last_scheduled_time() const {
    std::scoped_lock lock(mutex_);
    if (messages_.empty()) {
        return std::nullopt;
    }
    return messages_.rbegin()->first.when;
}

std::size_t MessageQueue::remove_messages(const Handler& target, std::optional<int> what) {
    Map removed;
    {
        std::scoped_lock lock(mutex_);
        for (auto it = messages_.begin(); it != messages_.end();) {
            const Message& message = it->second;
            if (message.target.get() == &target && (!what || message.what == *what)) {
                auto node = messages_.extract(it++);
                removed.insert(std::move(node));
            } else {
                ++it;
            }
        }
    }
    return removed.size();
}

bool MessageQueue::has_messages(const Handler& target, std::optional<int> what) const {
    std::scoped_lock lock(mutex_);
    for (const auto& [key, message] : messages_) {
        if (message.target.get() == &target && (!what || message.what == *what)) {
            return true;
        }
    }
    return false;
}

std::size_t MessageQueue::size() const {
    std::scoped_lock lock(mutex_);
    return messages_.size();
}

bool MessageQueue::empty() const {
    std::scoped_lock lock(mutex_);
    return messages_.empty();
}

bool MessageQueue::head_due_locked() const {
    if (messages_.empty()) {
        return false;
    }
    const MessageKey& head = messages_.begin()->first;
    return head.lane == MessageLane::FRONT || head.when <= clock_.now();
}

Message MessageQueue::take_head_locked() {
    auto node = messages_.extract(messages_.begin());
    return std::move(node.mapped());
}

} // namespace loopsim::core
