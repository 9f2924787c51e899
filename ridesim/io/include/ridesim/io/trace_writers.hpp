#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for simulation output.
///
/// Provides writers that implement the @ref core::TraceWriter interface:
/// a JSON streaming writer, an in-memory buffer for tests and analysis,
/// and a human-readable textual writer.
///
/// @ingroup io_writers

#include <ridesim/core/trace_writer.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace ridesim::io {

/// @brief Trace writer that streams JSON array elements to an output stream.
///
/// Each record is serialised as one JSON object on its own line. Call
/// @ref finalize to emit the closing bracket once the simulation is
/// complete.
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
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;

    /// @brief Serialise the current record and write it out.
    void end() override;

    /// @brief Write the closing bracket of the JSON array.
    ///
    /// Further calls are no-ops. The destructor calls this automatically
    /// if it has not been invoked.
    void finalize();

private:
    using FieldValue = std::variant<uint64_t, std::string>;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool first_record_{true};
    bool finalized_{false};

    core::TimePoint current_time_{0};
    std::string current_type_;
    std::vector<std::pair<std::string, FieldValue>> current_fields_;
};

/// @brief A single trace record stored in memory.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
struct TraceRecord {
    core::TimePoint time{0};  ///< Simulation time of the record.
    std::string type;         ///< Record type (e.g. "pickup").
    /// @brief Named fields attached to the record.
    std::unordered_map<std::string, std::variant<uint64_t, std::string>> fields;
};

/// @brief Trace writer that buffers all records in memory as @ref TraceRecord objects.
///
/// Ideal for unit tests and post-simulation analysis where the full trace
/// must be inspected programmatically.
///
/// @ingroup io_writers
/// @see TraceRecord, JsonTraceWriter
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;

    /// @brief Append the current record to the buffer.
    void end() override;

    /// @brief Access the accumulated trace records.
    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Discard all buffered records.
    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable textual trace writer.
///
/// Formats each record as a single line with aligned columns:
///
/// @code
/// [         1] (+         1)    rider_request: rider = xyz, patience = 4
/// @endcode
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
/// @see core::TraceWriter, JsonTraceWriter
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @brief Construct a textual writer targeting @p output.
    /// @param output  Destination stream (must outlive this writer).
    explicit TextualTraceWriter(std::ostream& output);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;

    /// @brief Write the buffered record as one line.
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::TimePoint current_time_{0};
    std::optional<core::TimePoint> prev_time_;
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace ridesim::io
