#pragma once

#include <qcloudsim/core/compute_device.hpp>
#include <qcloudsim/core/quantum_device.hpp>

#include <cstddef>
#include <vector>

namespace qcloudsim::algo {

/// @brief Non-owning, registration-ordered view of a cloud's devices.
/// @ingroup algo
///
/// Registration order is the tie-break order of every device selection.
struct DevicePool {
    std::vector<core::Device*> all;
    std::vector<core::QuantumDevice*> quantum;
    std::vector<core::ComputeDevice*> compute;

    /// @brief Largest qubit count of any quantum device (0 without QPUs).
    [[nodiscard]] std::size_t max_qubits() const noexcept {
        std::size_t best = 0;
        for (const auto* qpu : quantum) {
            if (qpu->num_qubits() > best) {
                best = qpu->num_qubits();
            }
        }
        return best;
    }
};

} // namespace qcloudsim::algo
