#include <loopsim/core/handler.hpp>
#include <loopsim/core/error.hpp>
#include <loopsim/core/loop.hpp>
#include <loopsim/core/message_queue.hpp>
#include <loopsim/core/tracing.hpp>

#include <utility>

namespace loopsim::core {

Handler::Handler(const std::shared_ptr<Loop>& loop)
    : loop_(loop)
    , loop_name_(loop ? loop->name() : std::string{}) {}

bool Handler::post(std::function<void()> task, Duration delay) {
    Message message;
    message.callback = std::move(task);
    return send(std::move(message), delay, false);
}

bool Handler::post_at_front(std::function<void()> task) {
    Message message;
    message.callback = std::move(task);
    return send(std::move(message), Duration::zero(), true);
}

bool Handler::send_message(Message message, Duration delay) {
    return send(std::move(message), delay, false);
}

bool Handler::send_message_at_front(Message message) {
    return send(std::move(message), Duration::zero(), true);
}

bool Handler::send(Message message, Duration delay, bool at_front) {
    auto self = weak_from_this().lock();
    if (!self) {
        throw InvalidStateError("Handler must be owned by a std::shared_ptr to send messages");
    }

    auto loop = loop_.lock();
    if (!loop) {
        trace_warning(loop_name_, "message sent to a handler whose loop no longer exists");
        return false;
    }

    MessageQueue& queue = loop->queue();
    if (delay < Duration::zero()) {
        delay = Duration::zero();
    }
    message.target = std::move(self);
    // Front-lane messages are stamped by the queue
    message.when = saturating_add(queue.clock().now(), delay);
    return queue.enqueue(std::move(message), at_front);
}

std::size_t Handler::remove_messages(std::optional<int> what) {
    auto loop = loop_.lock();
    if (!loop) {
        return 0;
    }
    return loop->queue().remove_messages(*this, what);
}

bool Handler::has_messages(std::optional<int> what) const {
    auto loop = loop_.lock();
    if (!loop) {
        return false;
    }
    return loop->queue().has_messages(*this, what);
}

void Handler::dispatch(Message& message) {
    if (message.callback) {
        message.callback();
    } else {
        handle_message(message);
    }
}

void Handler::handle_message(Message& /*message*/) {}

} // namespace loopsim::core
