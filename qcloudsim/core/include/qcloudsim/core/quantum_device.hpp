#pragma once

#include <qcloudsim/core/device.hpp>
#include <qcloudsim/core/device_profile.hpp>
#include <qcloudsim/core/qubit_topology.hpp>
#include <qcloudsim/core/semaphore.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace qcloudsim::core {

class MaintenanceProcess;
class TopologyAllocator;

/// @brief Quantum processor: qubit pool, connectivity graph, error profile.
///
/// process_job() runs one QPU phase:
///   1. log `devc_name` and `qpu_arrive`;
///   2. poll every time unit until the device is out of maintenance and
///      the allocator finds a free qubit subset of the job's size;
///   3. take that many units from the qubit semaphore, reserve the
///      subset, log `qpu_units` and `qpu_start`;
///   4. hold for the profile's processing time;
///   5. return the units, release the subset, log `qpu_finish` and
///      `fidelity`, then complete.
///
/// If the subset was taken by another job while waiting on the
/// semaphore, the units are handed back and admission polls again.
///
/// @ingroup core_devices
class QuantumDevice : public Device {
public:
    /// @param allocator Shared allocator guarding every device's topology.
    QuantumDevice(DeviceContext context, TopologyAllocator& allocator, std::string name,
                  QubitTopology topology, DeviceProfile profile);
    ~QuantumDevice() override;

    [[nodiscard]] DeviceKind kind() const noexcept override { return DeviceKind::Quantum; }

    /// @brief Total physical qubits.
    [[nodiscard]] std::size_t num_qubits() const noexcept { return topology_.num_qubits(); }

    [[nodiscard]] Semaphore& qubits() noexcept { return qubits_; }
    [[nodiscard]] const Semaphore& qubits() const noexcept { return qubits_; }

    [[nodiscard]] QubitTopology& topology() noexcept { return topology_; }
    [[nodiscard]] const QubitTopology& topology() const noexcept { return topology_; }

    [[nodiscard]] TopologyAllocator& allocator() noexcept { return allocator_; }

    [[nodiscard]] const DeviceProfile& profile() const noexcept { return profile_; }

    [[nodiscard]] Duration processing_time(const Job& job) const;
    [[nodiscard]] double estimate_fidelity(const Job& job) const;

    void process_job(Job& job, Completion on_done) override;
    void drop_waiters() override;

    /// @brief Start the periodic maintenance process if the profile enables it.
    ///
    /// Idempotent. The process never terminates on its own.
    void start_maintenance();

    [[nodiscard]] const MaintenanceProcess* maintenance() const noexcept {
        return maintenance_.get();
    }

private:
    friend class MaintenanceProcess;

    struct Run {
        Job* job;
        std::size_t required;
        std::vector<QubitId> selection;
        Completion done;
    };

    void try_admit(const std::shared_ptr<Run>& run);
    void on_qubits_acquired(const std::shared_ptr<Run>& run);
    void finish(const std::shared_ptr<Run>& run);
    void retry_later(const std::shared_ptr<Run>& run);

    TopologyAllocator& allocator_;
    QubitTopology topology_;
    DeviceProfile profile_;
    Semaphore qubits_;
    std::unique_ptr<MaintenanceProcess> maintenance_;
};

/// Admission polling step of a quantum device, in time units.
inline constexpr double kQpuRetryInterval = 1.0;

} // namespace qcloudsim::core
