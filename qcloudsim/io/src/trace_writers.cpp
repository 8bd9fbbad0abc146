#include <qcloudsim/io/trace_writers.hpp>

#include <iomanip>
#include <sstream>

namespace qcloudsim::io {

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
    : output_(output)
    , stream_(output)
    , writer_(stream_) {
    writer_.StartArray();
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::key(std::string_view name) {
    writer_.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::begin(core::TimePoint time) {
    writer_.StartObject();
    key("time");
    writer_.Double(core::time_to_units(time));
}

void JsonTraceWriter::type(std::string_view name) {
    key("type");
    writer_.String(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::field(std::string_view name, double value) {
    key(name);
    writer_.Double(value);
}

void JsonTraceWriter::field(std::string_view name, uint64_t value) {
    key(name);
    writer_.Uint64(value);
}

void JsonTraceWriter::field(std::string_view name, std::string_view value) {
    key(name);
    writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void JsonTraceWriter::end() {
    writer_.EndObject();
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    writer_.EndArray();
    output_ << "\n";
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = core::time_to_units(time);
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

std::vector<TraceRecord> MemoryTraceWriter::records_of(std::string_view type) const {
    std::vector<TraceRecord> matching;
    for (const auto& record : records_) {
        if (record.type == type) {
            matching.push_back(record);
        }
    }
    return matching;
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output)
    : output_(output) {}

void TextualTraceWriter::begin(core::TimePoint time) {
    current_time_ = core::time_to_units(time);
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
    output_ << "[" << std::setw(12) << std::fixed << std::setprecision(4)
            << current_time_ << "] ";

    if (prev_time_ >= 0.0 && current_time_ != prev_time_) {
        output_ << "(+" << std::setw(10) << std::fixed << std::setprecision(4)
                << (current_time_ - prev_time_) << ") ";
    } else {
        output_ << "(           ) ";
    }

    output_ << std::setw(18) << std::right << current_type_ << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].key << " = " << current_fields_[i].value;
    }

    output_ << "\n";
    prev_time_ = current_time_;
}

} // namespace qcloudsim::io
