#include <loopsim/io/trace_writers.hpp>

#include <rang.hpp>

#include <iomanip>
#include <sstream>

namespace loopsim::io {

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(core::TimePoint /*time*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output) {
    output_ << "[\n";
}

JsonTraceWriter::~JsonTraceWriter() {
    if (!finalized_) {
        finalize();
    }
}

void JsonTraceWriter::begin(core::TimePoint time) {
    if (!first_record_) {
        output_ << ",\n";
    }
    first_record_ = false;
    output_ << "  {\"time_ms\": " << core::time_to_millis(time);
}

void JsonTraceWriter::type(std::string_view name) {
    output_ << ", \"type\": \"" << escape_json_string(name) << "\"";
}

std::string JsonTraceWriter::escape_json_string(std::string_view str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0')
                        << std::setw(4) << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void JsonTraceWriter::field(std::string_view key, double value) {
    output_ << ", \"" << key << "\": " << std::setprecision(15) << value;
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    output_ << ", \"" << key << "\": " << value;
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    output_ << ", \"" << key << "\": \"" << escape_json_string(value) << "\"";
}

void JsonTraceWriter::end() {
    output_ << "}";
}

void JsonTraceWriter::finalize() {
    if (!finalized_) {
        if (!first_record_) {
            output_ << "\n";
        }
        output_ << "]\n";
        output_.flush();
        finalized_ = true;
    }
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

std::optional<std::string> TraceRecord::string_field(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<std::string>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

std::optional<uint64_t> TraceRecord::uint_field(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<uint64_t>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time_ms = core::time_to_millis(time);
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::vector<TraceRecord> MemoryTraceWriter::records_of_type(std::string_view type) const {
    std::vector<TraceRecord> result;
    for (const auto& record : records_) {
        if (record.type == type) {
            result.push_back(record);
        }
    }
    return result;
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

namespace {

rang::fg color_for(std::string_view type) {
    if (type == "dispatch") {
        return rang::fg::green;
    }
    if (type == "warning") {
        return rang::fg::yellow;
    }
    return rang::fg::magenta;
}

} // anonymous namespace

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {
    if (color_enabled_) {
        // Colour every stream, not only a detected terminal
        rang::setControlMode(rang::control::Force);
    }
}

void TextualTraceWriter::begin(core::TimePoint time) {
    current_time_ = core::time_to_millis(time);
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    current_fields_.push_back({std::string(key), oss.str()});
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.push_back({std::string(key), std::string(value)});
}

void TextualTraceWriter::end() {
    // Format: [   timestamp ms] (+  delta)   record_type: key = value, key = value
    output_ << "[" << std::setw(10) << current_time_ << " ms] ";

    if (prev_time_ && current_time_ != *prev_time_) {
        output_ << "(+" << std::setw(8) << (current_time_ - *prev_time_) << ") ";
    } else {
        output_ << "(         ) ";
    }

    if (color_enabled_) {
        output_ << color_for(current_type_) << rang::style::bold;
    }
    output_ << std::setw(14) << std::right << current_type_;
    if (color_enabled_) {
        output_ << rang::style::reset;
    }
    output_ << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " ";
        if (color_enabled_) {
            output_ << rang::fg::cyan << current_fields_[i].key << rang::fg::reset;
        } else {
            output_ << current_fields_[i].key;
        }
        output_ << " = " << current_fields_[i].value;
    }

    output_ << "\n";
    prev_time_ = current_time_;
}

} // namespace loopsim::io
