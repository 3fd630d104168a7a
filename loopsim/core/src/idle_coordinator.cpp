#include <loopsim/core/idle_coordinator.hpp>
#include <loopsim/core/message.hpp>
#include <loopsim/core/message_queue.hpp>
#include <loopsim/core/tracing.hpp>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

#include <exception>
#include <utility>

namespace loopsim::core {

IdleCoordinator::IdleCoordinator(MessageQueue& queue, std::size_t dispatch_limit)
    : queue_(queue)
    , dispatch_limit_(dispatch_limit) {}

std::future<void> IdleCoordinator::completion() {
    return done_.get_future();
}

std::size_t IdleCoordinator::drain() {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    std::size_t count = 0;
    while (count < dispatch_limit_) {
        // Checked and taken under one lock: a teardown may reset the queue
        auto message = queue_.poll_ready();
        if (!message) {
            break;
        }
        ++count;
        ++dispatched_;
        dispatch_message(std::move(*message), queue_.clock());
    }
    return count;
}

void IdleCoordinator::run() noexcept {
    try {
        drain();
    } catch (...) {
        // Handed to the waiting thread, which rethrows it
        done_.set_exception(std::current_exception());
        return;
    }
    done_.set_value();
}

void IdleCoordinator::wait_till_idle(std::future<void>& completion, std::string_view loop_name) {
    try {
        completion.get();
    } catch (const std::future_error& e) {
        if (e.code() != std::future_errc::broken_promise) {
            throw;
        }
        trace_warning(loop_name, "wait till idle interrupted: the loop quit before draining");
    }
}

} // namespace loopsim::core
