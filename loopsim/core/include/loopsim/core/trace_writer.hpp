#pragma once

#include <loopsim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace loopsim::core {

/// @brief Abstract interface for recording loop diagnostics.
/// @ingroup core
///
/// Implementations of TraceWriter serialise records to a specific format
/// (JSON, text, memory buffer, etc.). Each record is built incrementally:
///   1. begin() -- opens a new record at a given virtual time
///   2. type()  -- sets the record type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// Writers are installed process-wide with set_trace_writer(). Calls are
/// serialised by the tracing layer, so implementations need no locking of
/// their own.
///
/// @see set_trace_writer(), trace()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new record at the given virtual time.
    virtual void begin(TimePoint time) = 0;

    /// @brief Set the record type name (e.g. `"dispatch"`, `"warning"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace loopsim::core
