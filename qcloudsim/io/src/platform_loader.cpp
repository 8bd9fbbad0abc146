#include <qcloudsim/io/platform_loader.hpp>
#include <qcloudsim/io/error.hpp>

#include <qcloudsim/algo/hybrid_cloud.hpp>
#include <qcloudsim/core/compute_device.hpp>
#include <qcloudsim/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <optional>
#include <set>
#include <sstream>
#include <string>

namespace qcloudsim::io {

namespace {

using namespace qcloudsim::core;

template<typename T>
const T& get_member(const rapidjson::Value& obj, const char* name, const char* context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

std::string get_string(const rapidjson::Value& val, const char* name, const char* context) {
    const auto& member = get_member<rapidjson::Value>(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

uint64_t get_uint64(const rapidjson::Value& val, const char* name, const char* context) {
    const auto& member = get_member<rapidjson::Value>(val, name, context);
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    return member.GetUint64();
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name, const char* context) {
    const auto& member = get_member<rapidjson::Value>(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

const rapidjson::Value& get_object(const rapidjson::Value& val, const char* name, const char* context) {
    const auto& member = get_member<rapidjson::Value>(val, name, context);
    if (!member.IsObject()) {
        throw LoaderError(std::string("field '") + name + "' must be an object", context);
    }
    return member;
}

// Optional getters: absent means "keep the current value", a wrong type is an error.
std::optional<double> find_double(const rapidjson::Value& val, const char* name, const char* context) {
    if (!val.HasMember(name)) {
        return std::nullopt;
    }
    const auto& member = val[name];
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

double get_probability_or(const rapidjson::Value& val, const char* name, double default_val,
                          const char* context) {
    double value = find_double(val, name, context).value_or(default_val);
    if (value < 0.0 || value > 1.0) {
        throw LoaderError(std::string("field '") + name + "' must be in [0, 1]", context);
    }
    return value;
}

int64_t get_capacity_or(const rapidjson::Value& val, const char* name, int64_t default_val,
                        const char* context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsInt64() || member.GetInt64() <= 0) {
        throw LoaderError(std::string("field '") + name + "' must be a positive integer", context);
    }
    return member.GetInt64();
}

std::size_t get_size(const rapidjson::Value& val, const char* name, const char* context) {
    auto value = get_uint64(val, name, context);
    if (value == 0) {
        throw LoaderError(std::string("field '") + name + "' must be positive", context);
    }
    return static_cast<std::size_t>(value);
}

QubitTopology parse_topology(const rapidjson::Value& obj, const std::string& ctx) {
    if (obj.HasMember("topology")) {
        const auto& topo = get_object(obj, "topology", ctx.c_str());
        std::string tctx = ctx + ".topology";
        std::string kind = get_string(topo, "kind", tctx.c_str());
        if (kind == "grid") {
            return QubitTopology::grid(get_size(topo, "rows", tctx.c_str()),
                                       get_size(topo, "cols", tctx.c_str()));
        }
        std::size_t qubits = get_size(topo, "qubits", tctx.c_str());
        if (kind == "ring") {
            return QubitTopology::ring(qubits);
        }
        if (kind == "line") {
            return QubitTopology::line(qubits);
        }
        if (kind == "full") {
            return QubitTopology::full(qubits);
        }
        throw LoaderError("unknown topology kind '" + kind + "' (expected ring, line, grid or full)",
                          tctx);
    }

    std::size_t qubits = get_size(obj, "qubits", ctx.c_str());
    std::vector<QubitEdge> edges;
    if (obj.HasMember("edges")) {
        const auto& list = get_array(obj, "edges", ctx.c_str());
        for (rapidjson::SizeType eidx = 0; eidx < list.Size(); ++eidx) {
            const auto& edge = list[eidx];
            std::string ectx = ctx + ".edges[" + std::to_string(eidx) + "]";
            if (!edge.IsArray() || edge.Size() != 2 || !edge[0].IsUint() || !edge[1].IsUint()) {
                throw LoaderError("edge must be a pair of qubit indices", ectx);
            }
            edges.emplace_back(edge[0].GetUint(), edge[1].GetUint());
        }
    }

    try {
        return QubitTopology(qubits, std::move(edges));
    } catch (const SimulationError& e) {
        throw LoaderError(e.what(), ctx);
    }
}

DeviceProfile parse_profile(const rapidjson::Value& obj, const std::string& name,
                            const std::string& ctx) {
    DeviceProfile profile;
    if (obj.HasMember("preset")) {
        std::string preset = get_string(obj, "preset", ctx.c_str());
        try {
            profile = device_preset(preset);
        } catch (const OutOfRangeError& e) {
            throw LoaderError(e.what(), ctx);
        }
    } else {
        profile.model = name;
    }

    if (auto clops = find_double(obj, "clops", ctx.c_str())) {
        if (*clops <= 0.0) {
            throw LoaderError("clops must be positive", ctx);
        }
        profile.clops = clops;
    }
    if (auto qvol = find_double(obj, "quantum_volume", ctx.c_str())) {
        if (*qvol < 1.0) {
            throw LoaderError("quantum_volume must be >= 1", ctx);
        }
        profile.quantum_volume = qvol;
    }
    if (auto process_time = find_double(obj, "process_time", ctx.c_str())) {
        if (*process_time < 0.0) {
            throw LoaderError("process_time must be non-negative", ctx);
        }
        profile.process_time = process_time;
    }
    if (auto score = find_double(obj, "error_score", ctx.c_str())) {
        profile.error_score = score;
    }

    if (obj.HasMember("errors")) {
        const auto& errors = get_object(obj, "errors", ctx.c_str());
        std::string ectx = ctx + ".errors";
        profile.errors.single_qubit =
            get_probability_or(errors, "single_qubit", profile.errors.single_qubit, ectx.c_str());
        profile.errors.readout =
            get_probability_or(errors, "readout", profile.errors.readout, ectx.c_str());
        profile.errors.two_qubit =
            get_probability_or(errors, "two_qubit", profile.errors.two_qubit, ectx.c_str());
    }

    if (obj.HasMember("maintenance")) {
        const auto& maint = get_object(obj, "maintenance", ctx.c_str());
        std::string mctx = ctx + ".maintenance";
        // An explicit maintenance block turns the window on unless it says otherwise.
        profile.maintenance.enabled = true;
        if (maint.HasMember("enabled")) {
            if (!maint["enabled"].IsBool()) {
                throw LoaderError("field 'enabled' must be a boolean", mctx);
            }
            profile.maintenance.enabled = maint["enabled"].GetBool();
        }
        profile.maintenance.interval =
            find_double(maint, "interval", mctx.c_str()).value_or(profile.maintenance.interval);
        profile.maintenance.duration =
            find_double(maint, "duration", mctx.c_str()).value_or(profile.maintenance.duration);
        if (profile.maintenance.enabled &&
            (profile.maintenance.interval <= 0.0 || profile.maintenance.duration <= 0.0)) {
            throw LoaderError("maintenance interval and duration must be positive", mctx);
        }
    }
    return profile;
}

void parse_platform_impl(PlatformData& result, const rapidjson::Document& doc) {
    std::set<std::string, std::less<>> names;
    auto claim_name = [&names](const std::string& name, const std::string& ctx) {
        if (name.empty()) {
            throw LoaderError("device name must not be empty", ctx);
        }
        if (!names.insert(name).second) {
            throw LoaderError("duplicate device name '" + name + "'", ctx);
        }
    };

    if (doc.HasMember("quantum_devices")) {
        const auto& qpus = get_array(doc, "quantum_devices", "platform");
        for (rapidjson::SizeType idx = 0; idx < qpus.Size(); ++idx) {
            const auto& obj = qpus[idx];
            std::string ctx = "quantum_devices[" + std::to_string(idx) + "]";
            if (!obj.IsObject()) {
                throw LoaderError("device entry must be an object", ctx);
            }
            std::string name = get_string(obj, "name", ctx.c_str());
            claim_name(name, ctx);
            auto topology = parse_topology(obj, ctx);
            auto profile = parse_profile(obj, name, ctx);
            result.quantum_devices.push_back(
                QuantumDeviceParams{std::move(name), std::move(topology), std::move(profile)});
        }
    }

    if (doc.HasMember("compute_devices")) {
        const auto& cpus = get_array(doc, "compute_devices", "platform");
        for (rapidjson::SizeType idx = 0; idx < cpus.Size(); ++idx) {
            const auto& obj = cpus[idx];
            std::string ctx = "compute_devices[" + std::to_string(idx) + "]";
            if (!obj.IsObject()) {
                throw LoaderError("device entry must be an object", ctx);
            }
            std::string name = get_string(obj, "name", ctx.c_str());
            claim_name(name, ctx);
            result.compute_devices.push_back(ComputeDeviceParams{
                std::move(name),
                get_capacity_or(obj, "cpu_capacity", ComputeDevice::kDefaultCpuCapacity, ctx.c_str()),
                get_capacity_or(obj, "mem_bw_capacity", ComputeDevice::kDefaultMemBwCapacity,
                                ctx.c_str())});
        }
    }
}

} // anonymous namespace

PlatformData load_platform(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_platform_from_string(oss.str());
}

PlatformData load_platform_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "platform");
    }

    PlatformData result;
    parse_platform_impl(result, doc);
    return result;
}

void build_platform(algo::HybridCloud& cloud, const PlatformData& platform) {
    for (const auto& qpu : platform.quantum_devices) {
        cloud.add_quantum_device(qpu.name, qpu.topology, qpu.profile);
    }
    for (const auto& cpu : platform.compute_devices) {
        cloud.add_compute_device(cpu.name, cpu.cpu_capacity, cpu.mem_bw_capacity);
    }
}

} // namespace qcloudsim::io
