#pragma once

#include <qcloudsim/core/device_profile.hpp>
#include <qcloudsim/core/priority_mutex.hpp>

#include <cstddef>
#include <optional>

namespace qcloudsim::core {

class QuantumDevice;

/// @brief Periodic maintenance window of one quantum device.
///
/// After a warm-up drawn uniformly from [60, 120] time units the process
/// loops forever: wait `interval`, raise the device's maintenance lock,
/// take the device mutex at priority 1, hold for `duration`, lower the
/// lock and release the mutex. The lock only blocks new admissions; jobs
/// already running on the device are not preempted.
///
/// @ingroup core_devices
class MaintenanceProcess {
public:
    /// Mutex priority of a maintenance window (outranks every job).
    static constexpr int kPriority = 1;
    static constexpr int kWarmupMin = 60;
    static constexpr int kWarmupMax = 120;

    MaintenanceProcess(QuantumDevice& device, MaintenanceParams params);

    MaintenanceProcess(const MaintenanceProcess&) = delete;
    MaintenanceProcess& operator=(const MaintenanceProcess&) = delete;

    void start();

    [[nodiscard]] bool started() const noexcept { return started_; }
    [[nodiscard]] bool in_window() const noexcept { return lock_.has_value(); }
    [[nodiscard]] std::size_t windows_completed() const noexcept { return windows_completed_; }

private:
    void wait_interval();
    void begin_window();
    void end_window();

    QuantumDevice& device_;
    MaintenanceParams params_;
    bool started_{false};
    std::size_t windows_completed_{0};
    std::optional<PriorityMutex::Lock> lock_;
};

} // namespace qcloudsim::core
