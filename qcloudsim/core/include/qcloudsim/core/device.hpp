#pragma once

#include <qcloudsim/core/priority_mutex.hpp>
#include <qcloudsim/core/types.hpp>

#include <functional>
#include <random>
#include <string>
#include <string_view>

namespace qcloudsim::core {

class Engine;
class EventBus;
class JobLedger;
struct Job;

/// @brief Device family.
/// @ingroup core_devices
enum class DeviceKind {
    Quantum,
    Compute,
};

/// @brief Simulation services shared by every device of a cloud.
///
/// All members are non-owning; the owner (usually algo::HybridCloud)
/// must outlive every device built with this context.
///
/// @ingroup core_devices
struct DeviceContext {
    Engine& engine;      // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    JobLedger& ledger;   // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    EventBus& bus;       // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::mt19937& rng;   // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

/// @brief Base class of the quantum and compute device processes.
///
/// A device owns its capacity resources and a PriorityMutex used to
/// serialise allocation transactions (serial brokers, bulk allocation
/// and maintenance all go through it). process_job() is a suspending
/// operation: it returns as soon as the job blocks and calls
/// @p on_done once the job's resources are back in the pools.
///
/// Devices are non-copyable and non-movable; continuations capture
/// their address.
///
/// @ingroup core_devices
class Device {
public:
    using Completion = std::function<void()>;

    virtual ~Device() = default;

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;
    Device(Device&&) = delete;
    Device& operator=(Device&&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] virtual DeviceKind kind() const noexcept = 0;

    /// @brief Lock serialising allocation transactions on this device.
    [[nodiscard]] PriorityMutex& mutex() noexcept { return mutex_; }

    /// @brief True while a maintenance window blocks new admissions.
    [[nodiscard]] bool under_maintenance() const noexcept { return maint_lock_; }

    /// @brief Run one phase of @p job on this device.
    ///
    /// @p job must stay alive until @p on_done has been called.
    virtual void process_job(Job& job, Completion on_done) = 0;

    /// @brief Forget every request queued on this device's mutex and pools.
    ///
    /// Called before a cloud is torn down, while every device is still
    /// alive, so that continuations holding locks on other devices are
    /// destroyed first.
    virtual void drop_waiters();

protected:
    Device(DeviceContext context, std::string name);

    /// @brief Publish a lifecycle notification and mirror it to the trace.
    void notify(std::string_view event_type, const Job& job);

    DeviceContext ctx_;
    std::string name_;
    PriorityMutex mutex_;
    bool maint_lock_{false};
};

} // namespace qcloudsim::core
