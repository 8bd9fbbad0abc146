#pragma once

#include <qcloudsim/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qcloudsim::core {

struct Job;

/// @brief Calibration aggregates of a quantum device.
/// @ingroup core_devices
struct ErrorProfile {
    double single_qubit{0.0}; ///< Average single-qubit gate error.
    double readout{0.0};      ///< Average readout assignment error.
    double two_qubit{0.0};    ///< Average two-qubit gate error.
};

/// @brief Periodic maintenance window of a quantum device (in time units).
/// @ingroup core_devices
struct MaintenanceParams {
    bool enabled{false};
    double interval{0.0};
    double duration{0.0};
};

/// @brief Static parameters of one quantum device model.
///
/// One record replaces a family of per-model device types: the constants
/// that differ between models live here, and named presets are plain
/// instances of it.
///
/// @see device_preset
/// @ingroup core_devices
struct DeviceProfile {
    std::string model;                     ///< Preset or model name.
    std::optional<double> clops;           ///< Circuit layer operations per second.
    std::optional<double> quantum_volume;
    std::optional<double> process_time;    ///< Fixed service time override, in units.
    ErrorProfile errors;
    std::optional<double> error_score;     ///< Ranking score for bulk "smart" placement.
    MaintenanceParams maintenance;

    /// @brief Score used to rank devices; falls back to the two-qubit error.
    [[nodiscard]] double score() const noexcept {
        return error_score.value_or(errors.two_qubit);
    }
};

/// Layers per circuit in the throughput model.
inline constexpr double kCircuitLayers = 100.0;
/// Circuit templates per job in the throughput model.
inline constexpr double kCircuitTemplates = 10.0;

/// @brief Service time of one QPU run of @p job on a device with @p profile.
///
/// Uses the override when present, otherwise
/// `M*K*shots*log2(quantum_volume)/clops/60`, otherwise (no throughput
/// constants) `num_qubits*100`.
[[nodiscard]] Duration qpu_processing_time(const DeviceProfile& profile, const Job& job);

/// @brief Estimated success probability of @p job run on a single device.
///
/// `(1 - single_qubit_error)^depth * (1 - readout_error)^num_qubits`.
[[nodiscard]] double single_device_fidelity(const DeviceProfile& profile, const Job& job);

/// @brief Look up a named model preset (case-sensitive, e.g. "ibm_fez").
/// @throws OutOfRangeError if the name is unknown.
[[nodiscard]] const DeviceProfile& device_preset(std::string_view name);

/// @brief Names of every registered preset, in registry order.
[[nodiscard]] std::vector<std::string_view> preset_names();

} // namespace qcloudsim::core
