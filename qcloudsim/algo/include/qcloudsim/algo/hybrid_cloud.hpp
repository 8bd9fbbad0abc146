#pragma once

#include <qcloudsim/algo/bulk_allocator.hpp>
#include <qcloudsim/algo/device_pool.hpp>
#include <qcloudsim/algo/error.hpp>
#include <qcloudsim/algo/scheduler.hpp>

#include <qcloudsim/core/compute_device.hpp>
#include <qcloudsim/core/device_profile.hpp>
#include <qcloudsim/core/event_bus.hpp>
#include <qcloudsim/core/job.hpp>
#include <qcloudsim/core/job_ledger.hpp>
#include <qcloudsim/core/quantum_device.hpp>
#include <qcloudsim/core/qubit_topology.hpp>
#include <qcloudsim/core/topology_allocator.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace qcloudsim::core {
class Engine;
} // namespace qcloudsim::core

namespace qcloudsim::algo {

/// @brief Knobs of a simulated cloud.
/// @ingroup algo
struct CloudConfig {
    SchedulerPolicy scheduler{SchedulerPolicy::CapacityAware};
    std::optional<BulkPolicy> bulk;  ///< Route oversized jobs through bulk allocation.
    uint32_t seed{0};
    bool maintenance{true};          ///< Start maintenance of devices whose profile enables it.
};

/// @brief A hybrid quantum/classical cloud: devices, broker, ledger.
/// @ingroup algo
///
/// Owns every device, the shared topology allocator, the event bus, the
/// job ledger, the random engine and the scheduler strategy. Devices are
/// registered first, then start() builds the scheduler and starts the
/// maintenance processes; from then on submit() admits jobs at the
/// current simulated time.
///
/// A job no device can ever host (more qubits than any QPU without a
/// bulk policy, or nothing to run on at all) is rejected at arrival with
/// a `rejected` ledger entry instead of polling forever.
///
/// Destroying the cloud discards every event still pending on the engine,
/// together with the requests queued on its devices. Continuations of
/// jobs in flight hold locks on the devices; they must not outlive them.
/// The engine must therefore not be shared with another cloud.
///
/// @code
/// core::Engine engine;
/// algo::HybridCloud cloud(engine, {});
/// cloud.add_quantum_device("q0", core::QubitTopology::ring(5), {});
/// cloud.add_compute_device("c0");
/// cloud.start();
/// cloud.submit(job);
/// engine.run([&] { return cloud.idle(); });
/// @endcode
class HybridCloud {
public:
    HybridCloud(core::Engine& engine, CloudConfig config);
    ~HybridCloud();

    HybridCloud(const HybridCloud&) = delete;
    HybridCloud& operator=(const HybridCloud&) = delete;
    HybridCloud(HybridCloud&&) = delete;
    HybridCloud& operator=(HybridCloud&&) = delete;

    /// @throws core::InvalidStateError if called after start() or on a duplicate name.
    core::QuantumDevice& add_quantum_device(std::string name, core::QubitTopology topology,
                                            core::DeviceProfile profile);

    /// @throws core::InvalidStateError if called after start() or on a duplicate name.
    core::ComputeDevice& add_compute_device(
        std::string name, int64_t cpu_capacity = core::ComputeDevice::kDefaultCpuCapacity,
        int64_t mem_bw_capacity = core::ComputeDevice::kDefaultMemBwCapacity);

    /// @brief Build the scheduler and start maintenance.
    /// @throws ConfigurationError if a bulk policy is set with fewer than two QPUs.
    void start();

    [[nodiscard]] bool started() const noexcept { return scheduler_ != nullptr; }

    /// @brief Admit @p job now: log its arrival and spawn its broker.
    /// @throws core::InvalidStateError before start() or on a reused job id.
    void submit(core::Job job);

    /// @brief True when every admitted job has finished or was rejected.
    [[nodiscard]] bool idle() const noexcept { return active_ == 0; }

    [[nodiscard]] std::size_t submitted() const noexcept { return jobs_.size(); }
    [[nodiscard]] std::size_t completed() const noexcept { return completed_; }
    [[nodiscard]] std::size_t rejected() const noexcept { return rejected_; }

    [[nodiscard]] core::Engine& engine() noexcept { return engine_; }
    [[nodiscard]] const CloudConfig& config() const noexcept { return config_; }
    [[nodiscard]] core::JobLedger& ledger() noexcept { return ledger_; }
    [[nodiscard]] const core::JobLedger& ledger() const noexcept { return ledger_; }
    [[nodiscard]] core::EventBus& bus() noexcept { return bus_; }
    [[nodiscard]] std::mt19937& rng() noexcept { return rng_; }
    [[nodiscard]] const DevicePool& devices() const noexcept { return pool_; }
    [[nodiscard]] core::TopologyAllocator& allocator() noexcept { return allocator_; }

    /// @throws core::InvalidStateError before start().
    [[nodiscard]] Scheduler& scheduler();

    /// @brief Job state by id, or nullptr if never submitted.
    [[nodiscard]] const core::Job* find_job(core::JobId id) const;

private:
    [[nodiscard]] bool can_host(const core::Job& job) const noexcept;
    void check_new_device(const std::string& name) const;
    void job_done(core::JobId id);
    [[nodiscard]] core::DeviceContext context() noexcept;

    core::Engine& engine_;
    CloudConfig config_;
    std::mt19937 rng_;
    core::JobLedger ledger_;
    core::EventBus bus_;
    core::TopologyAllocator allocator_;

    std::vector<std::unique_ptr<core::Device>> devices_;
    DevicePool pool_;
    std::unique_ptr<BulkAllocator> bulk_;
    std::unique_ptr<Scheduler> scheduler_;

    std::map<core::JobId, std::unique_ptr<core::Job>> jobs_;
    std::size_t active_{0};
    std::size_t completed_{0};
    std::size_t rejected_{0};
};

} // namespace qcloudsim::algo
