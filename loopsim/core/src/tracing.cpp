#include <loopsim/core/tracing.hpp>

#include <atomic>

namespace loopsim::core {

namespace {

std::atomic<TraceWriter*> g_trace_writer{nullptr};

} // anonymous namespace

void set_trace_writer(TraceWriter* writer) noexcept {
    std::scoped_lock lock(detail::trace_mutex());
    g_trace_writer.store(writer, std::memory_order_release);
}

TraceWriter* trace_writer() noexcept {
    return g_trace_writer.load(std::memory_order_acquire);
}

std::mutex& detail::trace_mutex() noexcept {
    static std::mutex mutex;
    return mutex;
}

void trace_warning(std::string_view source, std::string_view message) {
    trace([&](TraceWriter& w) {
        w.type("warning");
        w.field("source", source);
        w.field("message", message);
    });
}

} // namespace loopsim::core
