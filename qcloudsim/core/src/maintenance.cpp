#include <qcloudsim/core/maintenance.hpp>
#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/quantum_device.hpp>

#include <random>
#include <utility>

namespace qcloudsim::core {

MaintenanceProcess::MaintenanceProcess(QuantumDevice& device, MaintenanceParams params)
    : device_(device)
    , params_(params) {}

void MaintenanceProcess::start() {
    if (started_) {
        return;
    }
    started_ = true;
    std::uniform_int_distribution<int> warmup(kWarmupMin, kWarmupMax);
    double delay = warmup(device_.ctx_.rng);
    device_.ctx_.engine.timeout(duration_from_units(delay), [this] { wait_interval(); });
}

void MaintenanceProcess::wait_interval() {
    device_.ctx_.engine.timeout(duration_from_units(params_.interval), [this] { begin_window(); });
}

void MaintenanceProcess::begin_window() {
    device_.maint_lock_ = true;
    device_.ctx_.engine.trace([&](TraceWriter& w) {
        w.type("maintenance_start");
        w.field("device", device_.name());
    });
    device_.mutex().request(kPriority, [this](PriorityMutex::Lock lock) {
        lock_ = std::move(lock);
        device_.ctx_.engine.timeout(duration_from_units(params_.duration), [this] { end_window(); });
    });
}

void MaintenanceProcess::end_window() {
    device_.maint_lock_ = false;
    lock_.reset();
    ++windows_completed_;
    device_.ctx_.engine.trace([&](TraceWriter& w) {
        w.type("maintenance_end");
        w.field("device", device_.name());
    });
    wait_interval();
}

} // namespace qcloudsim::core
