#include <qcloudsim/io/job_loader.hpp>
#include <qcloudsim/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>

namespace qcloudsim::io {

namespace {

using namespace qcloudsim::core;

constexpr const char* kRequiredColumns[] = {"job_id", "num_qubits", "depth", "num_shots",
                                            "priority"};

// A row split into named raw fields; missing columns are absent from the map.
using RawJob = std::map<std::string, std::string, std::less<>>;

std::string trim(std::string_view text) {
    auto first = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c) != 0; });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
                                 [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return first < last ? std::string(first, last) : std::string{};
}

std::vector<std::string> split_row(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(trim(cell));
    }
    // A trailing comma denotes an empty last cell.
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

uint64_t parse_uint(const std::string& text, std::string_view name, const std::string& ctx) {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw LoaderError("field '" + std::string(name) + "' must be a non-negative integer", ctx);
    }
    return value;
}

double parse_double(const std::string& text, std::string_view name, const std::string& ctx) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        throw LoaderError("field '" + std::string(name) + "' must be a number", ctx);
    }
    return value;
}

uint32_t parse_count(const std::string& text, std::string_view name, const std::string& ctx) {
    auto value = parse_uint(text, name, ctx);
    if (value == 0 || value > std::numeric_limits<uint32_t>::max()) {
        throw LoaderError("field '" + std::string(name) + "' must be >= 1", ctx);
    }
    return static_cast<uint32_t>(value);
}

// Builds a Job from named raw fields; blank optional fields take their defaults.
Job make_job(const RawJob& raw, const std::string& ctx) {
    auto required = [&](std::string_view name) -> const std::string& {
        auto it = raw.find(name);
        if (it == raw.end() || it->second.empty()) {
            throw LoaderError("missing required field '" + std::string(name) + "'", ctx);
        }
        return it->second;
    };
    auto optional = [&](std::string_view name) -> std::optional<std::string> {
        auto it = raw.find(name);
        if (it == raw.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second;
    };

    Job job;
    job.id = parse_uint(required("job_id"), "job_id", ctx);
    job.num_qubits = parse_count(required("num_qubits"), "num_qubits", ctx);
    job.depth = parse_count(required("depth"), "depth", ctx);
    job.num_shots = parse_uint(required("num_shots"), "num_shots", ctx);
    auto priority = parse_uint(required("priority"), "priority", ctx);
    if (priority > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        throw LoaderError("field 'priority' is out of range", ctx);
    }
    job.priority = static_cast<int>(priority);

    if (auto arrival = optional("arrival_time")) {
        double units = parse_double(*arrival, "arrival_time", ctx);
        if (units < 0.0) {
            throw LoaderError("arrival_time must be non-negative", ctx);
        }
        job.arrival_time = time_from_units(units);
    }
    if (auto iterations = optional("iterations")) {
        job.iterations = parse_count(*iterations, "iterations", ctx);
    }
    if (auto cpu = optional("cpu_units")) {
        job.cpu_units = static_cast<int64_t>(parse_count(*cpu, "cpu_units", ctx));
    }
    if (auto bw = optional("mem_bw")) {
        job.mem_bw = static_cast<int64_t>(parse_count(*bw, "mem_bw", ctx));
    }
    return job;
}

void check_unique_ids(const std::vector<Job>& jobs) {
    std::set<JobId> ids;
    for (std::size_t idx = 0; idx < jobs.size(); ++idx) {
        if (!ids.insert(jobs[idx].id).second) {
            throw LoaderError("duplicate job_id " + std::to_string(jobs[idx].id),
                              "jobs[" + std::to_string(idx) + "]");
        }
    }
}

// JSON scalars are normalised to the text form the CSV path parses.
std::string json_scalar(const rapidjson::Value& val, const char* name, const std::string& ctx) {
    if (val.IsNull()) {
        return {};
    }
    if (val.IsString()) {
        return trim(std::string_view(val.GetString(), val.GetStringLength()));
    }
    if (val.IsUint64()) {
        return std::to_string(val.GetUint64());
    }
    if (val.IsNumber()) {
        std::ostringstream oss;
        oss.precision(17);
        oss << val.GetDouble();
        return oss.str();
    }
    throw LoaderError(std::string("field '") + name + "' must be a number", ctx);
}

} // anonymous namespace

std::vector<Job> load_jobs(const std::filesystem::path& path) {
    auto extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (extension != ".csv" && extension != ".json") {
        throw LoaderError("unsupported job file type '" + extension + "' (expected .csv or .json)",
                          path.string());
    }

    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (extension == ".csv") {
        return load_jobs_from_csv_string(oss.str());
    }
    return load_jobs_from_json_string(oss.str());
}

std::vector<Job> load_jobs_from_csv_string(std::string_view csv) {
    std::istringstream input{std::string(csv)};
    std::string line;
    std::size_t line_no = 0;

    std::vector<std::string> header;
    while (header.empty() && std::getline(input, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!trim(line).empty()) {
            header = split_row(line);
        }
    }
    if (header.empty()) {
        throw LoaderError("missing header row", "csv");
    }
    for (const char* column : kRequiredColumns) {
        if (std::find(header.begin(), header.end(), column) == header.end()) {
            throw LoaderError(std::string("missing required column '") + column + "'", "csv header");
        }
    }

    std::vector<Job> jobs;
    while (std::getline(input, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }
        std::string ctx = "line " + std::to_string(line_no);
        auto cells = split_row(line);
        if (cells.size() > header.size()) {
            throw LoaderError("too many fields (" + std::to_string(cells.size()) + " for " +
                                  std::to_string(header.size()) + " columns)",
                              ctx);
        }
        RawJob raw;
        for (std::size_t col = 0; col < cells.size(); ++col) {
            raw[header[col]] = cells[col];
        }
        jobs.push_back(make_job(raw, ctx));
    }

    check_unique_ids(jobs);
    return jobs;
}

std::vector<Job> load_jobs_from_json_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "jobs");
    }
    if (!doc.HasMember("jobs")) {
        throw LoaderError("missing required field 'jobs'", "jobs");
    }
    const auto& list = doc["jobs"];
    if (!list.IsArray()) {
        throw LoaderError("field 'jobs' must be an array", "jobs");
    }

    std::vector<Job> jobs;
    for (rapidjson::SizeType idx = 0; idx < list.Size(); ++idx) {
        const auto& obj = list[idx];
        std::string ctx = "jobs[" + std::to_string(idx) + "]";
        if (!obj.IsObject()) {
            throw LoaderError("job entry must be an object", ctx);
        }
        RawJob raw;
        for (auto it = obj.MemberBegin(); it != obj.MemberEnd(); ++it) {
            std::string name(it->name.GetString(), it->name.GetStringLength());
            raw[name] = json_scalar(it->value, name.c_str(), ctx);
        }
        jobs.push_back(make_job(raw, ctx));
    }

    check_unique_ids(jobs);
    return jobs;
}

} // namespace qcloudsim::io
