#pragma once

#include <qcloudsim/algo/device_pool.hpp>
#include <qcloudsim/algo/scheduler.hpp>

#include <memory>

namespace qcloudsim::core {
class Engine;
class JobLedger;
} // namespace qcloudsim::core

namespace qcloudsim::algo {

class BulkAllocator;

/// @brief Iterative QPU/CPU broker with most-free-first device selection.
/// @ingroup algo_schedulers
///
/// Each job walks the state machine
/// `Arrived -> SelectQpu -> QpuRun -> SelectCpu -> CpuRun`, looping back
/// to SelectQpu until `iterations` runs are done, then `Done`.
///
/// Selection keeps devices of the phase's kind that are not under
/// maintenance and whose free capacity covers the demand (free qubits,
/// and total qubits for the physical fit; free CPU units and memory
/// bandwidth for compute). The device with the most free capacity wins
/// (CPU ties broken by memory bandwidth, remaining ties by registration
/// order). With no candidate, the broker polls again after 0.5 units.
///
/// After each run it records wait/service/turnaround for that iteration,
/// and the makespan after the last one.
///
/// Jobs larger than every quantum device run their QPU phase through the
/// BulkAllocator when one is attached.
class CapacityAwareScheduler : public Scheduler {
public:
    static constexpr double kPollInterval = 0.5;

    CapacityAwareScheduler(core::Engine& engine, core::JobLedger& ledger,
                           const DevicePool& devices, BulkAllocator* bulk = nullptr);

    /// @brief Most free QPU for SelectQpu jobs, most free compute device otherwise.
    [[nodiscard]] core::Device* select_device(const core::Job& job) override;
    void run(core::Job& job, Completion on_done) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "capacity"; }

    /// @brief True if the job cannot fit on any single quantum device.
    [[nodiscard]] bool needs_bulk(const core::Job& job) const noexcept;

private:
    struct Run {
        core::Job* job;
        Completion done;
    };

    void select_phase(const std::shared_ptr<Run>& run);
    void start_phase(const std::shared_ptr<Run>& run, core::Device* device);
    void phase_finished(const std::shared_ptr<Run>& run);

    [[nodiscard]] core::QuantumDevice* select_qpu(const core::Job& job) const;
    [[nodiscard]] core::ComputeDevice* select_cpu(const core::Job& job) const;

    core::Engine& engine_;
    core::JobLedger& ledger_;
    const DevicePool& devices_;
    BulkAllocator* bulk_;
};

} // namespace qcloudsim::algo
