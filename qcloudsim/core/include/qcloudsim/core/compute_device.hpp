#pragma once

#include <qcloudsim/core/device.hpp>
#include <qcloudsim/core/semaphore.hpp>

#include <cstdint>
#include <memory>
#include <string>

namespace qcloudsim::core {

/// @brief Classical node with CPU-unit and memory-bandwidth pools.
///
/// process_job() runs one CPU phase: it draws a service time in [1, 3]
/// and a CPU-unit demand in [4, 10], takes the CPU units and then the
/// memory bandwidth (the job's demand, 20 by default), holds both for the
/// service time and returns them. The two acquisitions are separate
/// steps; if the second one faults structurally the CPU units are handed
/// back before the fault propagates.
///
/// Ledger keys: `devc_name`, `cpu_arrive`, `cpu_units`, `cpu_mem_bw`,
/// `cpu_start`, `cpu_finish`.
///
/// @ingroup core_devices
class ComputeDevice : public Device {
public:
    static constexpr int64_t kDefaultCpuCapacity = 100;
    static constexpr int64_t kDefaultMemBwCapacity = 200;
    static constexpr int64_t kMinCpuDraw = 4;
    static constexpr int64_t kMaxCpuDraw = 10;
    static constexpr double kMinServiceTime = 1.0;
    static constexpr double kMaxServiceTime = 3.0;

    ComputeDevice(DeviceContext context, std::string name,
                  int64_t cpu_capacity = kDefaultCpuCapacity,
                  int64_t mem_bw_capacity = kDefaultMemBwCapacity);

    [[nodiscard]] DeviceKind kind() const noexcept override { return DeviceKind::Compute; }

    [[nodiscard]] Semaphore& cpu_units() noexcept { return cpu_units_; }
    [[nodiscard]] const Semaphore& cpu_units() const noexcept { return cpu_units_; }
    [[nodiscard]] Semaphore& mem_bw() noexcept { return mem_bw_; }
    [[nodiscard]] const Semaphore& mem_bw() const noexcept { return mem_bw_; }

    /// @brief True if a worst-case draw for @p job fits this node's capacities.
    ///
    /// The CPU draw is random up to kMaxCpuDraw, so a node is only
    /// considered when it could hold the larger of that and the job's own
    /// demand.
    [[nodiscard]] bool fits(const Job& job) const noexcept;

    void process_job(Job& job, Completion on_done) override;
    void drop_waiters() override;

private:
    struct Run {
        Job* job;
        int64_t units;
        int64_t bandwidth;
        Duration service;
        Completion done;
    };

    void acquire_bandwidth(const std::shared_ptr<Run>& run);
    void start(const std::shared_ptr<Run>& run);
    void finish(const std::shared_ptr<Run>& run);

    Semaphore cpu_units_;
    Semaphore mem_bw_;
};

} // namespace qcloudsim::core
