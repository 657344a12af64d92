#include <rrsched/io/trace_writers.hpp>

#include <iomanip>
#include <utility>
#include <sstream>

namespace rrsched::io {

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(core::TimePoint /*time*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, int64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , stream_(output)
    , writer_(stream_) {
    writer_.StartArray();
}

JsonTraceWriter::~JsonTraceWriter() {
    if (!finalized_) {
        finalize();
    }
}

void JsonTraceWriter::begin(core::TimePoint time) {
    if (finalized_) {
        return;
    }
    in_record_ = true;
    writer_.StartObject();
    writer_.Key("time");
    writer_.Double(core::time_to_seconds(time));
}

void JsonTraceWriter::type(std::string_view name) {
    field("type", name);
}

void JsonTraceWriter::field(std::string_view key, double value) {
    if (!in_record_) {
        return;
    }
    writer_.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    writer_.Double(value);
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    if (!in_record_) {
        return;
    }
    writer_.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    writer_.Uint64(value);
}

void JsonTraceWriter::field(std::string_view key, int64_t value) {
    if (!in_record_) {
        return;
    }
    writer_.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    writer_.Int64(value);
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    if (!in_record_) {
        return;
    }
    writer_.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
    writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void JsonTraceWriter::end() {
    if (!in_record_) {
        return;
    }
    writer_.EndObject();
    in_record_ = false;
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    if (in_record_) {
        end();
    }
    writer_.EndArray();
    stream_.Flush();
    output_ << '\n';
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = core::time_to_seconds(time);
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

void MemoryTraceWriter::field(std::string_view key, int64_t value) {
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

constexpr const char* COLOR_RESET = "\033[0m";
constexpr const char* COLOR_GREEN = "\033[32m";
constexpr const char* COLOR_YELLOW = "\033[33m";
constexpr const char* COLOR_RED = "\033[31m";

} // anonymous namespace

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(core::TimePoint time) {
    current_time_ = core::time_to_seconds(time);
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

void TextualTraceWriter::field(std::string_view key, int64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.push_back({std::string(key), std::string(value)});
}

const char* TextualTraceWriter::color_for(std::string_view type) const {
    if (!color_enabled_) {
        return nullptr;
    }
    if (type == "task_completed") {
        return COLOR_GREEN;
    }
    if (type == "scheduler_idle") {
        return COLOR_YELLOW;
    }
    if (type == "shutdown_timeout" || type == "task_retrieval_error") {
        return COLOR_RED;
    }
    return nullptr;
}

void TextualTraceWriter::end() {
    // Format: [  timestamp] (+  delta)   event_name: key = value, key = value
    output_ << "[" << std::setw(10) << std::fixed << std::setprecision(5)
            << current_time_ << "] ";

    if (prev_time_ >= 0.0 && current_time_ != prev_time_) {
        output_ << "(+" << std::setw(10) << std::fixed << std::setprecision(5)
                << (current_time_ - prev_time_) << ") ";
    } else {
        output_ << "(           ) ";
    }

    const char* color = color_for(current_type_);
    if (color != nullptr) {
        output_ << color;
    }
    output_ << std::setw(22) << std::right << current_type_;
    if (color != nullptr) {
        output_ << COLOR_RESET;
    }
    output_ << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].key << " = " << current_fields_[i].value;
    }

    output_ << "\n";
    prev_time_ = current_time_;
}

} // namespace rrsched::io
