#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for the engine's event log.
///
/// Provides several writers that implement the @ref core::TraceWriter
/// interface: a no-op writer, a streaming JSON writer, an in-memory buffer
/// for tests and post-processing, and a human-readable textual writer with
/// optional ANSI colour output.
///
/// @ingroup io_writers

#include <rrsched/core/trace_writer.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace rrsched::io {

/// @brief Trace writer that silently discards all events.
///
/// @ingroup io_writers
/// @see core::TraceWriter
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer that streams records as a JSON array.
///
/// Each record becomes one object `{"time": ..., "type": ..., fields...}`
/// written through a rapidjson streaming writer, so strings are escaped and
/// numbers formatted by rapidjson. Call @ref finalize to close the array
/// once the engine has stopped; the destructor does it otherwise.
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

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the JSON array and flush the stream.
    ///
    /// Idempotent. Records begun after finalize() are dropped.
    void finalize();

private:
    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream_;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer_;
    bool in_record_{false};
    bool finalized_{false};
};

/// @brief A single trace record stored in memory.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
struct TraceRecord {
    double time;        ///< Engine-relative time of the event (seconds).
    std::string type;   ///< Event name (e.g. "task_completed").
    /// @brief Named fields attached to the event.
    std::unordered_map<std::string, std::variant<double, uint64_t, int64_t, std::string>> fields;
};

/// @brief Trace writer that buffers all events in memory as @ref TraceRecord objects.
///
/// Ideal for unit tests where the full event log must be inspected
/// programmatically.
///
/// @ingroup io_writers
/// @see TraceRecord, JsonTraceWriter
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Access the accumulated trace records.
    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records whose type equals @p type, in order.
    [[nodiscard]] std::vector<TraceRecord> records_of_type(std::string_view type) const;

    /// @brief Discard all buffered records.
    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable textual trace writer with optional ANSI colour.
///
/// Formats each event as a single line with aligned columns. Completions
/// are shown in green, idle transitions in yellow and warnings in red when
/// colour is enabled.
///
/// @ingroup io_writers
/// @see core::TraceWriter, JsonTraceWriter, NullTraceWriter
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a textual writer targeting @p output.
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  If true, emit ANSI escape codes for colour.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    [[nodiscard]] const char* color_for(std::string_view type) const;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    double current_time_{0.0};
    double prev_time_{-1.0};
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace rrsched::io
