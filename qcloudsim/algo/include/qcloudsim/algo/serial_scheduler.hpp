#pragma once

#include <qcloudsim/algo/device_pool.hpp>
#include <qcloudsim/algo/scheduler.hpp>

#include <qcloudsim/core/priority_mutex.hpp>

#include <memory>
#include <optional>
#include <random>

namespace qcloudsim::core {
class Engine;
class JobLedger;
} // namespace qcloudsim::core

namespace qcloudsim::algo {

/// @brief Single-pass broker: one random device, one process_job call.
/// @ingroup algo_schedulers
///
/// The device is drawn uniformly from the devices able to host the job
/// (every compute device, and quantum devices with enough qubits). The
/// broker polls every time unit while that device is under maintenance,
/// then takes the device mutex at priority 2 and holds it for the whole
/// process_job() call. There is no phase iteration and no capacity-based
/// selection.
class SerialScheduler : public Scheduler {
public:
    static constexpr int kMutexPriority = 2;
    static constexpr double kMaintenancePoll = 1.0;

    SerialScheduler(core::Engine& engine, core::JobLedger& ledger, const DevicePool& devices,
                    std::mt19937& rng);

    [[nodiscard]] core::Device* select_device(const core::Job& job) override;
    void run(core::Job& job, Completion on_done) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "serial"; }

private:
    struct Run {
        core::Job* job;
        core::Device* device;
        std::optional<core::PriorityMutex::Lock> lock;
        Completion done;
    };

    void wait_maintenance(const std::shared_ptr<Run>& run);
    void execute(const std::shared_ptr<Run>& run);
    void complete(const std::shared_ptr<Run>& run);

    core::Engine& engine_;
    core::JobLedger& ledger_;
    const DevicePool& devices_;
    std::mt19937& rng_;
};

} // namespace qcloudsim::algo
