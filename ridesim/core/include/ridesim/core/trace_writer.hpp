#pragma once

#include <ridesim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace ridesim::core {

/// @brief Abstract interface for logging the events of a simulation.
/// @ingroup core
///
/// Implementations serialise records to a specific format (JSON, text,
/// memory buffer, ...). Each record is built incrementally:
///   1. begin() -- opens a new record at a given simulation time
///   2. type()  -- sets the record type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// The Engine holds an optional pointer to a TraceWriter. When no writer
/// is installed the overhead is a single null-pointer check.
///
/// @see Engine::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record at the given simulation time.
    virtual void begin(TimePoint time) = 0;

    /// @brief Set the record type name (e.g. `"pickup"`, `"sim_finished"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add an unsigned integer field to the current record.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record.
    ///
    /// After this call the writer is ready for a new begin()/end() cycle.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace ridesim::core
