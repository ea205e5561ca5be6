#pragma once

#include <cstdint>
#include <string_view>

namespace jobsched::core {

/// @brief Abstract interface for recording solver trace events.
/// @ingroup core
///
/// Implementations of TraceWriter serialise solver events to a specific
/// format (JSON, text, memory buffer, etc.). Each trace record is built
/// incrementally:
///   1. begin() -- opens a new record with a sequence number
///   2. type()  -- sets the event type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// The sequence number is solver-defined and monotonic within one solve:
/// the placement index for the list scheduler, the generation for the
/// genetic optimizer, the search node for the backtracking solver.
///
/// Solvers hold an optional pointer to a TraceWriter. When no writer is
/// installed the overhead is a single null-pointer check.
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record.
    /// @param sequence Solver-defined position of the event.
    virtual void begin(uint64_t sequence) = 0;

    /// @brief Set the event type name for the current record.
    /// @param name A short identifier for the event category
    ///        (e.g. `"place"`, `"generation"`, `"rollback"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a signed integer field to the current record (times, makespans).
    virtual void field(std::string_view key, int64_t value) = 0;

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

} // namespace jobsched::core
