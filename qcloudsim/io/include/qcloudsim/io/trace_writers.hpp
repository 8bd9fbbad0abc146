#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for simulation output.
///
/// A no-op writer, a JSON array writer, an in-memory buffer for tests
/// and post-processing, and a one-line-per-record textual writer.
///
/// @ingroup io_writers

#include <qcloudsim/core/trace_writer.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace qcloudsim::io {

/// @brief Trace writer that silently discards all events.
///
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer producing one JSON array of record objects.
///
/// Each record is an object `{"time": t, "type": "...", <fields>}`.
/// Call @ref finalize to close the array once the simulation is over; the
/// destructor does it otherwise.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output  Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Close the JSON array and flush. Idempotent.
    void finalize();

private:
    void key(std::string_view name);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream_;
    rapidjson::Writer<rapidjson::OStreamWrapper> writer_;
    bool finalized_{false};
};

/// @brief A single trace record stored in memory.
///
/// @ingroup io_writers
/// @see MemoryTraceWriter
struct TraceRecord {
    double time;        ///< Simulation time of the event (units).
    std::string type;   ///< Event type identifier (e.g. "phase_start").
    /// @brief Named fields attached to the event.
    std::map<std::string, std::variant<double, uint64_t, std::string>> fields;
};

/// @brief Trace writer that buffers all events in memory.
///
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records of the given type, in emission order.
    [[nodiscard]] std::vector<TraceRecord> records_of(std::string_view type) const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable textual trace writer.
///
/// Format: `[      time] (+     delta)           type: key = value, ...`
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    explicit TextualTraceWriter(std::ostream& output);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::TimePoint time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    struct FieldEntry {
        std::string key;
        std::string value;
    };

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    double current_time_{0.0};
    double prev_time_{-1.0};
    std::string current_type_;
    std::vector<FieldEntry> current_fields_;
};

} // namespace qcloudsim::io
