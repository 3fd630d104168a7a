#include <loopsim/core/message.hpp>
#include <loopsim/core/handler.hpp>
#include <loopsim/core/tracing.hpp>
#include <loopsim/core/virtual_clock.hpp>

#include <utility>

namespace loopsim::core {

void dispatch_message(Message message, VirtualClock& clock) {
    clock.set_absolute(message.when);

    trace([&](TraceWriter& w) {
        w.type("dispatch");
        if (message.target) {
            w.field("loop", std::string_view{message.target->loop_name()});
        }
        if (!message.tag.empty()) {
            w.field("tag", std::string_view{message.tag});
        }
        // Signed: carried as a double
        w.field("what", static_cast<double>(message.what));
        w.field("when_ms", static_cast<uint64_t>(time_to_millis(message.when)));
        w.field("sequence", message.sequence);
    });

    if (message.target) {
        message.target->dispatch(message);
    } else if (message.callback) {
        message.callback();
    }
}

} // namespace loopsim::core
