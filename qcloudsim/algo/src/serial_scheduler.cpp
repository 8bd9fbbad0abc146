#include <qcloudsim/algo/serial_scheduler.hpp>
#include <qcloudsim/algo/phase_metrics.hpp>

#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/error.hpp>
#include <qcloudsim/core/job_ledger.hpp>

#include <string>
#include <utility>
#include <vector>

namespace qcloudsim::algo {

SerialScheduler::SerialScheduler(core::Engine& engine, core::JobLedger& ledger,
                                 const DevicePool& devices, std::mt19937& rng)
    : engine_(engine)
    , ledger_(ledger)
    , devices_(devices)
    , rng_(rng) {}

core::Device* SerialScheduler::select_device(const core::Job& job) {
    std::vector<core::Device*> hosts;
    for (auto* device : devices_.all) {
        if (device->kind() == core::DeviceKind::Quantum &&
            static_cast<core::QuantumDevice*>(device)->num_qubits() < job.num_qubits) {
            continue;
        }
        if (device->kind() == core::DeviceKind::Compute &&
            !static_cast<core::ComputeDevice*>(device)->fits(job)) {
            continue;
        }
        hosts.push_back(device);
    }
    if (hosts.empty()) {
        return nullptr;
    }
    std::uniform_int_distribution<std::size_t> pick(0, hosts.size() - 1);
    return hosts[pick(rng_)];
}

void SerialScheduler::run(core::Job& job, Completion on_done) {
    core::Device* device = select_device(job);
    if (device == nullptr) {
        throw core::InvalidStateError("No device can host job " + std::to_string(job.id));
    }
    auto run = std::make_shared<Run>(Run{&job, device, std::nullopt, std::move(on_done)});
    wait_maintenance(run);
}

void SerialScheduler::wait_maintenance(const std::shared_ptr<Run>& run) {
    if (run->device->under_maintenance()) {
        engine_.timeout(core::duration_from_units(kMaintenancePoll),
                        [this, run] { wait_maintenance(run); });
        return;
    }
    run->device->mutex().request(kMutexPriority, [this, run](core::PriorityMutex::Lock lock) {
        run->lock = std::move(lock);
        execute(run);
    });
}

void SerialScheduler::execute(const std::shared_ptr<Run>& run) {
    core::Job& job = *run->job;
    job.phase = run->device->kind() == core::DeviceKind::Quantum ? core::JobPhase::QpuRun
                                                                 : core::JobPhase::CpuRun;
    engine_.trace([&](core::TraceWriter& w) {
        w.type("phase_start");
        w.field("job_id", static_cast<uint64_t>(job.id));
        w.field("phase", core::to_string(job.phase));
        w.field("device", run->device->name());
    });
    run->device->process_job(job, [this, run] { complete(run); });
}

void SerialScheduler::complete(const std::shared_ptr<Run>& run) {
    run->lock.reset();
    core::Job& job = *run->job;
    const char* phase = job.phase == core::JobPhase::QpuRun ? "qpu" : "cpu";
    engine_.trace([&](core::TraceWriter& w) {
        w.type("phase_finish");
        w.field("job_id", static_cast<uint64_t>(job.id));
        w.field("phase", core::to_string(job.phase));
    });
    record_phase_metrics(engine_, ledger_, job.id, phase, 0);
    record_makespan(engine_, ledger_, job.id, phase);
    job.iteration = job.iterations;
    job.phase = core::JobPhase::Done;

    Completion done = std::move(run->done);
    done();
}

} // namespace qcloudsim::algo
