#pragma once

/// @file platform_loader.hpp
/// @brief Load a cloud platform (quantum and compute devices) from JSON.
/// @ingroup io_loaders

#include <qcloudsim/core/device_profile.hpp>
#include <qcloudsim/core/qubit_topology.hpp>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace qcloudsim::algo {
class HybridCloud;
} // namespace qcloudsim::algo

namespace qcloudsim::io {

/// @brief One quantum device entry of a platform file.
/// @ingroup io_loaders
struct QuantumDeviceParams {
    std::string name;
    core::QubitTopology topology;
    core::DeviceProfile profile;
};

/// @brief One compute device entry of a platform file.
/// @ingroup io_loaders
struct ComputeDeviceParams {
    std::string name;
    int64_t cpu_capacity;
    int64_t mem_bw_capacity;
};

/// @brief Every device declared by a platform file, in file order.
/// @ingroup io_loaders
struct PlatformData {
    std::vector<QuantumDeviceParams> quantum_devices;
    std::vector<ComputeDeviceParams> compute_devices;
};

/// @brief Load a platform description from a JSON file.
///
/// Format:
/// @code{.json}
/// {
///   "quantum_devices": [
///     { "name": "qpu0", "preset": "ibm_fez",
///       "topology": { "kind": "grid", "rows": 3, "cols": 4 },
///       "errors": { "single_qubit": 0.001, "readout": 0.02, "two_qubit": 0.008 },
///       "maintenance": { "enabled": true } },
///     { "name": "qpu1", "qubits": 5, "edges": [[0,1],[1,2],[2,3],[3,4],[4,0]],
///       "process_time": 2.0 }
///   ],
///   "compute_devices": [ { "name": "cpu0", "cpu_capacity": 100, "mem_bw_capacity": 200 } ]
/// }
/// @endcode
///
/// A `preset` seeds the device profile from the registry; any field given
/// explicitly overrides the preset value.
///
/// @throws LoaderError  If the file cannot be read, the JSON is malformed,
///                      a required field is missing or a value is invalid.
PlatformData load_platform(const std::filesystem::path& path);

/// @brief Load a platform description from a JSON string.
/// @throws LoaderError  If the JSON is malformed or fails validation.
PlatformData load_platform_from_string(std::string_view json);

/// @brief Register every device of @p platform with @p cloud.
///
/// Must be called before HybridCloud::start().
void build_platform(algo::HybridCloud& cloud, const PlatformData& platform);

} // namespace qcloudsim::io
