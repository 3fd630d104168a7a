#pragma once

#include <loopsim/core/trace_writer.hpp>
#include <loopsim/core/virtual_clock.hpp>

#include <mutex>
#include <string_view>

namespace loopsim::core {

/// @brief Install the process-wide trace writer.
///
/// The caller keeps ownership; the writer must stay alive until it is
/// replaced or cleared. Pass nullptr to disable tracing.
///
/// @param writer Pointer to a TraceWriter, or nullptr.
void set_trace_writer(TraceWriter* writer) noexcept;

/// @brief Returns the installed trace writer, or nullptr.
[[nodiscard]] TraceWriter* trace_writer() noexcept;

/// @brief Installs a trace writer for the lifetime of a scope.
///
/// The previously installed writer is restored on destruction, including
/// when the scope is left by an exception, so the writer is never left
/// installed after it is destroyed.
///
/// @code
/// auto writer = std::make_unique<io::JsonTraceWriter>(out);
/// {
///     ScopedTraceWriter installed(writer.get());
///     run();
/// }
/// @endcode
class ScopedTraceWriter {
public:
    explicit ScopedTraceWriter(TraceWriter* writer) noexcept
        : previous_(trace_writer()) {
        set_trace_writer(writer);
    }

    ~ScopedTraceWriter() { set_trace_writer(previous_); }

    ScopedTraceWriter(const ScopedTraceWriter&) = delete;
    ScopedTraceWriter& operator=(const ScopedTraceWriter&) = delete;
    ScopedTraceWriter(ScopedTraceWriter&&) = delete;
    ScopedTraceWriter& operator=(ScopedTraceWriter&&) = delete;

private:
    TraceWriter* previous_;
};

namespace detail {
[[nodiscard]] std::mutex& trace_mutex() noexcept;
} // namespace detail

/// @brief Invoke a tracing callback only if a trace writer is installed.
///
/// Costs a single atomic load when tracing is disabled. Records coming
/// from different loop threads are serialised; each is stamped with the
/// current VirtualClock::global() time.
///
/// @tparam F Callable with signature void(TraceWriter&).
/// @param func Callback that writes the record fields.
template<typename F>
void trace(F&& func) {
    if (trace_writer() == nullptr) {
        return;
    }
    std::scoped_lock lock(detail::trace_mutex());
    if (TraceWriter* writer = trace_writer()) {
        writer->begin(VirtualClock::global().now());
        func(*writer);
        writer->end();
    }
}

/// @brief Emit a `warning` record carrying @p message.
/// @param source  Component raising the warning (loop name, "registry"...).
/// @param message Human-readable description.
void trace_warning(std::string_view source, std::string_view message);

} // namespace loopsim::core
