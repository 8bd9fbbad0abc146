#include <qcloudsim/core/quantum_device.hpp>
#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/error.hpp>
#include <qcloudsim/core/event_bus.hpp>
#include <qcloudsim/core/job.hpp>
#include <qcloudsim/core/job_ledger.hpp>
#include <qcloudsim/core/maintenance.hpp>
#include <qcloudsim/core/topology_allocator.hpp>

#include <algorithm>
#include <utility>

namespace qcloudsim::core {

QuantumDevice::QuantumDevice(DeviceContext context, TopologyAllocator& allocator,
                             std::string name, QubitTopology topology, DeviceProfile profile)
    : Device(context, std::move(name))
    , allocator_(allocator)
    , topology_(std::move(topology))
    , profile_(std::move(profile))
    , qubits_(context.engine, name_ + ".qubits", static_cast<int64_t>(topology_.num_qubits())) {}

QuantumDevice::~QuantumDevice() = default;

Duration QuantumDevice::processing_time(const Job& job) const {
    return qpu_processing_time(profile_, job);
}

double QuantumDevice::estimate_fidelity(const Job& job) const {
    return single_device_fidelity(profile_, job);
}

void QuantumDevice::drop_waiters() {
    Device::drop_waiters();
    qubits_.drop_waiters();
}

void QuantumDevice::start_maintenance() {
    if (!profile_.maintenance.enabled || maintenance_) {
        return;
    }
    maintenance_ = std::make_unique<MaintenanceProcess>(*this, profile_.maintenance);
    maintenance_->start();
}

void QuantumDevice::process_job(Job& job, Completion on_done) {
    std::size_t required = std::max<std::size_t>(1, job.num_qubits);
    if (required > num_qubits()) {
        throw ResourceError("Job " + std::to_string(job.id) + " needs " +
                            std::to_string(required) + " qubits but " + name_ + " has " +
                            std::to_string(num_qubits()));
    }

    auto run = std::make_shared<Run>(Run{&job, required, {}, std::move(on_done)});
    ctx_.ledger.log(job.id, "devc_name", name_);
    ctx_.ledger.log_time(job.id, "qpu_arrive", ctx_.engine.time());
    try_admit(run);
}

void QuantumDevice::retry_later(const std::shared_ptr<Run>& run) {
    ctx_.engine.timeout(duration_from_units(kQpuRetryInterval), [this, run] { try_admit(run); });
}

void QuantumDevice::try_admit(const std::shared_ptr<Run>& run) {
    if (maint_lock_) {
        retry_later(run);
        return;
    }
    auto selection = allocator_.select(topology_, run->required);
    if (!selection) {
        retry_later(run);
        return;
    }
    run->selection = std::move(*selection);
    qubits_.acquire(static_cast<int64_t>(run->required), [this, run] { on_qubits_acquired(run); });
}

void QuantumDevice::on_qubits_acquired(const std::shared_ptr<Run>& run) {
    // The subset may have been reserved by another job while we queued
    if (!topology_.all_free(run->selection)) {
        auto selection = allocator_.select(topology_, run->required);
        if (!selection) {
            qubits_.release(static_cast<int64_t>(run->required));
            retry_later(run);
            return;
        }
        run->selection = std::move(*selection);
    }
    allocator_.reserve(topology_, run->selection);

    const Job& job = *run->job;
    ctx_.ledger.log(job.id, "qpu_units", static_cast<double>(run->required));
    ctx_.ledger.log_time(job.id, "qpu_start", ctx_.engine.time());
    ctx_.engine.trace([&](TraceWriter& w) {
        w.type("qubits_reserved");
        w.field("device", name_);
        w.field("job_id", static_cast<uint64_t>(job.id));
        w.field("qubits", static_cast<uint64_t>(run->required));
    });
    notify(device_events::start, job);

    ctx_.engine.timeout(processing_time(job), [this, run] { finish(run); });
}

void QuantumDevice::finish(const std::shared_ptr<Run>& run) {
    const Job& job = *run->job;
    qubits_.release(static_cast<int64_t>(run->required));
    allocator_.release(topology_, run->selection);

    ctx_.ledger.log_time(job.id, "qpu_finish", ctx_.engine.time());
    ctx_.ledger.log(job.id, "fidelity", round4(estimate_fidelity(job)));
    ctx_.engine.trace([&](TraceWriter& w) {
        w.type("qubits_released");
        w.field("device", name_);
        w.field("job_id", static_cast<uint64_t>(job.id));
        w.field("qubits", static_cast<uint64_t>(run->required));
    });
    notify(device_events::finish, job);

    Completion done = std::move(run->done);
    done();
}

} // namespace qcloudsim::core
