#include <ridesim/io/trace_writers.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <iomanip>

namespace ridesim::io {

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
    current_time_ = time;
    current_type_.clear();
    current_fields_.clear();
}

void JsonTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void JsonTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.emplace_back(std::string(key), value);
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.emplace_back(std::string(key), std::string(value));
}

void JsonTraceWriter::end() {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("time");
    writer.Uint64(current_time_);
    writer.Key("type");
    writer.String(current_type_.c_str(), static_cast<rapidjson::SizeType>(current_type_.size()));
    for (const auto& [key, value] : current_fields_) {
        writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
        if (const auto* number = std::get_if<uint64_t>(&value)) {
            writer.Uint64(*number);
        } else {
            const auto& text = std::get<std::string>(value);
            writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
        }
    }
    writer.EndObject();

    if (!first_record_) {
        output_ << ",\n";
    }
    first_record_ = false;
    output_ << "  " << buffer.GetString();
}

void JsonTraceWriter::finalize() {
    if (!finalized_) {
        if (!first_record_) {
            // Records were written, add newline before closing bracket
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

void MemoryTraceWriter::begin(core::TimePoint time) {
    current_ = TraceRecord{};
    current_.time = time;
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
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

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output)
    : output_(output) {}

void TextualTraceWriter::begin(core::TimePoint time) {
    current_time_ = time;
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.push_back({std::string(key), std::to_string(value)});
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.push_back({std::string(key), std::string(value)});
}

void TextualTraceWriter::end() {
    // Format: [  timestamp] (+     delta)   event_name: key = value, key = value
    output_ << "[" << std::setw(10) << current_time_ << "] ";

    if (prev_time_ && current_time_ != *prev_time_) {
        output_ << "(+" << std::setw(10) << (current_time_ - *prev_time_) << ") ";
    } else {
        output_ << "(           ) ";
    }

    output_ << std::setw(16) << std::right << current_type_ << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].key << " = " << current_fields_[i].value;
    }

    output_ << "\n";
    prev_time_ = current_time_;
}

} // namespace ridesim::io
