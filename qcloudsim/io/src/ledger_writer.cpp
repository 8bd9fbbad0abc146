#include <qcloudsim/io/ledger_writer.hpp>
#include <qcloudsim/io/error.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <string>
#include <variant>

namespace qcloudsim::io {

namespace {

void write_value(rapidjson::Writer<rapidjson::StringBuffer>& writer, const core::RecordValue& value) {
    if (const auto* number = std::get_if<double>(&value)) {
        writer.Double(*number);
    } else {
        const auto& text = std::get<std::string>(value);
        writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
    }
}

} // anonymous namespace

std::string ledger_to_json(const core::JobLedger& ledger) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    for (const auto& [job, record] : ledger.records()) {
        std::string id = std::to_string(job);
        writer.Key(id.c_str(), static_cast<rapidjson::SizeType>(id.size()));
        writer.StartObject();
        for (const auto& [key, values] : record) {
            writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
            if (values.size() == 1) {
                write_value(writer, values.front());
                continue;
            }
            writer.StartArray();
            for (const auto& value : values) {
                write_value(writer, value);
            }
            writer.EndArray();
        }
        writer.EndObject();
    }
    writer.EndObject();

    return {buffer.GetString(), buffer.GetSize()};
}

void write_ledger_to_stream(const core::JobLedger& ledger, std::ostream& out) {
    out << ledger_to_json(ledger) << "\n";
}

void write_ledger(const core::JobLedger& ledger, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_ledger_to_stream(ledger, file);
}

} // namespace qcloudsim::io
