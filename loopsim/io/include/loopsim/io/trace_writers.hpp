#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for loop simulation output.
///
/// Provides several writers that implement the @ref core::TraceWriter
/// interface: a no-op writer for benchmarking, a JSON streaming writer,
/// an in-memory buffer for tests, and a human-readable textual writer with
/// optional colour output (rang).
///
/// Record times are virtual-clock milliseconds.
///
/// @ingroup io_writers

#include <loopsim/core/trace_writer.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace loopsim::io {

/// @brief Trace writer that silently discards all records.
///
/// @ingroup io_writers
/// @see core::TraceWriter
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer that streams JSON array elements to an output stream.
///
/// Writes one JSON object per record directly to the provided stream
/// (file or stdout). Call @ref finalize to emit the closing bracket once
/// the run is complete.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::TraceWriter, MemoryTraceWriter, TextualTraceWriter
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a JSON writer targeting @p output.
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);

    /// @brief Destructor; calls @ref finalize if not already called.
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    /// @brief Begin a new JSON record at virtual time @p time.
    void begin(core::TimePoint time) override;

    /// @brief Set the record type field in the current JSON object.
    void type(std::string_view name) override;

    /// @brief Add a floating-point field to the current JSON object.
    void field(std::string_view key, double value) override;

    /// @brief Add an unsigned integer field to the current JSON object.
    void field(std::string_view key, uint64_t value) override;

    /// @brief Add a string field to the current JSON object.
    /// @param key    Field name.
    /// @param value  Field value (will be JSON-escaped).
    void field(std::string_view key, std::string_view value) override;

    /// @brief Close the current JSON object.
    void end() override;

    /// @brief Write the closing bracket of the JSON array.
    ///
    /// The destructor calls this automatically if it has not been invoked.
    void finalize();

private:
    static std::string escape_json_string(std::string_view str);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief A single trace record stored in memory.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
struct TraceRecord {
    int64_t time_ms{0}; ///< Virtual time of the record, in milliseconds.
    std::string type;   ///< Record type (e.g. "dispatch", "warning").
    /// @brief Named fields attached to the record.
    std::unordered_map<std::string, std::variant<double, uint64_t, std::string>> fields;

    /// @brief String field @p key, or nullopt if absent or not a string.
    [[nodiscard]] std::optional<std::string> string_field(const std::string& key) const;

    /// @brief Unsigned field @p key, or nullopt if absent or not an integer.
    [[nodiscard]] std::optional<uint64_t> uint_field(const std::string& key) const;
};

/// @brief Trace writer that buffers all records in memory.
///
/// Used by unit tests to inspect the dispatch trace programmatically.
///
/// @ingroup io_writers
/// @see TraceRecord, JsonTraceWriter
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Access the accumulated trace records.
    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records of type @p type, in emission order.
    [[nodiscard]] std::vector<TraceRecord> records_of_type(std::string_view type) const;

    /// @brief Discard all buffered records.
    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable textual trace writer with optional colour.
///
/// Formats each record as a single line with aligned columns. Colour can
/// be disabled for piping to files or non-terminal sinks.
///
/// @ingroup io_writers
/// @see core::TraceWriter, JsonTraceWriter, NullTraceWriter
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a textual writer targeting @p output.
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  If true, colour record types and keys with rang.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;

    /// @brief Flush the buffered fields and write the formatted line.
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    int64_t current_time_{0};
    std::optional<int64_t> prev_time_;
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace loopsim::io
