#pragma once

#include <qcloudsim/algo/device_pool.hpp>
#include <qcloudsim/algo/error.hpp>

#include <qcloudsim/core/priority_mutex.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace qcloudsim::core {
class Engine;
class JobLedger;
struct Job;
} // namespace qcloudsim::core

namespace qcloudsim::algo {

/// @brief Qubits assigned to one device of a split job.
/// @ingroup algo_bulk
struct BulkShare {
    core::QuantumDevice* device;
    int64_t qubits;
};

/// @brief Runs one QPU phase of a job split across several quantum devices.
/// @ingroup algo_bulk
///
/// allocate() proceeds in five steps:
///   1. Poll every time unit until at least two devices are eligible: out
///      of maintenance, with `ceil(qubits / device_count)` free qubits and
///      a topology selection of that size.
///   2. Plan the shares with the configured BulkPolicy. A plan with a
///      share above its device's free qubits goes back to polling.
///   3. For each share in order, take the device mutex at priority 2 and
///      then the share's qubits. If a later acquisition faults, every
///      share already held is returned before the fault propagates.
///   4. Wait `0.02 * (q_i + q_{i+1}) + 0.02` for every adjacent pair, then
///      the slowest device's processing time.
///   5. Return all qubits and record the split fidelity.
///
/// Ledger keys: `qpu_arrive`, `devc_name`, `devc_proc`, `qpu_start`,
/// `comm_time`, `devc_finish`, `qpu_finish`, `fidelity`.
class BulkAllocator {
public:
    using Completion = std::function<void()>;

    static constexpr int kMutexPriority = 2;
    static constexpr double kRetryInterval = 1.0;
    static constexpr double kCommDelayPerQubit = 0.02;
    static constexpr double kFeedbackDelay = 0.02;
    static constexpr double kCommPenalty = 0.94;

    BulkAllocator(core::Engine& engine, core::JobLedger& ledger, const DevicePool& devices,
                  BulkPolicy policy);

    [[nodiscard]] BulkPolicy policy() const noexcept { return policy_; }

    /// @brief Devices currently eligible for a share of @p job, in pool order.
    [[nodiscard]] std::vector<core::QuantumDevice*> eligible_devices(const core::Job& job) const;

    /// @brief Split @p job over @p eligible according to the policy.
    ///
    /// Fast uses every device. Smart sorts by ascending error score and
    /// keeps the shortest prefix whose free qubits cover the job and whose
    /// even split fits every member (all of them if none does). The job's
    /// qubits are spread evenly, the remainder going one by one to the
    /// first devices.
    [[nodiscard]] std::vector<BulkShare> plan(const core::Job& job,
                                              std::vector<core::QuantumDevice*> eligible) const;

    /// @brief True if every share fits in its device's free qubits right now.
    [[nodiscard]] static bool fits(std::span<const BulkShare> shares) noexcept;

    /// @brief Mean per-device fidelity times `0.94^(shares - 1)`.
    ///
    /// Each device contributes
    /// `(1 - single_qubit_error)^depth * (1 - readout_error)^sqrt(qubits / shares)`
    /// with integer division inside the root.
    [[nodiscard]] static double fidelity(const core::Job& job, std::span<const BulkShare> shares);

    /// @brief Run the QPU phase of @p job; @p on_done fires once all qubits are back.
    void allocate(core::Job& job, Completion on_done);

private:
    struct Run {
        core::Job* job;
        std::vector<BulkShare> shares;
        std::size_t acquired{0};
        std::size_t next_pair{0};
        std::optional<core::PriorityMutex::Lock> lock;
        Completion done;
    };

    void wait_for_devices(const std::shared_ptr<Run>& run);
    void acquire_next(const std::shared_ptr<Run>& run);
    void roll_back(const std::shared_ptr<Run>& run);
    void communicate(const std::shared_ptr<Run>& run);
    void execute(const std::shared_ptr<Run>& run);
    void finish(const std::shared_ptr<Run>& run);

    core::Engine& engine_;
    core::JobLedger& ledger_;
    const DevicePool& devices_;
    BulkPolicy policy_;
};

} // namespace qcloudsim::algo
