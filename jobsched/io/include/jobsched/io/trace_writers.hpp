#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for solver output.
///
/// Provides writers implementing the @ref core::TraceWriter interface:
/// a JSON streaming writer and a human-readable textual writer.
///
/// @ingroup io_writers

#include <jobsched/core/trace_writer.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace jobsched::io {

/// @brief Trace writer that streams JSON array elements to an output stream.
///
/// Writes one JSON object per trace event directly to the provided stream.
/// Call @ref finalize to emit the closing bracket once solving is complete;
/// the destructor does it otherwise.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::TraceWriter, TextualTraceWriter
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

    void begin(uint64_t sequence) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, int64_t value) override;

    /// @brief Add a string field; the value is JSON-escaped.
    void field(std::string_view key, std::string_view value) override;

    void end() override;

    /// @brief Write the closing bracket of the JSON array.
    ///
    /// Idempotent. The destructor calls this automatically if it has not
    /// been invoked.
    void finalize();

private:
    static std::string escape_json_string(std::string_view str);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief Human-readable textual trace writer.
///
/// Formats each event as a single line: sequence number, event type
/// right-aligned, then `key = value` pairs in insertion order. Colour can be
/// disabled for piping to files or non-terminal sinks.
///
/// @ingroup io_writers
/// @see core::TraceWriter, JsonTraceWriter
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

    void begin(uint64_t sequence) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, int64_t value) override;
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
    uint64_t current_sequence_{0};
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace jobsched::io
