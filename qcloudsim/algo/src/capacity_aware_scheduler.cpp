#include <qcloudsim/algo/capacity_aware_scheduler.hpp>
#include <qcloudsim/algo/bulk_allocator.hpp>
#include <qcloudsim/algo/phase_metrics.hpp>

#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/error.hpp>
#include <qcloudsim/core/job_ledger.hpp>

#include <string>
#include <utility>

namespace qcloudsim::algo {

namespace {

bool is_qpu_phase(core::JobPhase phase) noexcept {
    return phase == core::JobPhase::SelectQpu || phase == core::JobPhase::QpuRun;
}

} // namespace

CapacityAwareScheduler::CapacityAwareScheduler(core::Engine& engine, core::JobLedger& ledger,
                                               const DevicePool& devices, BulkAllocator* bulk)
    : engine_(engine)
    , ledger_(ledger)
    , devices_(devices)
    , bulk_(bulk) {}

bool CapacityAwareScheduler::needs_bulk(const core::Job& job) const noexcept {
    return job.num_qubits > devices_.max_qubits();
}

core::QuantumDevice* CapacityAwareScheduler::select_qpu(const core::Job& job) const {
    const auto required = static_cast<int64_t>(job.num_qubits);
    core::QuantumDevice* best = nullptr;
    for (auto* qpu : devices_.quantum) {
        if (qpu->under_maintenance() || qpu->qubits().level() < required ||
            qpu->num_qubits() < job.num_qubits) {
            continue;
        }
        if (best == nullptr || qpu->qubits().level() > best->qubits().level()) {
            best = qpu;
        }
    }
    return best;
}

core::ComputeDevice* CapacityAwareScheduler::select_cpu(const core::Job& job) const {
    const int64_t cpu = job.cpu_units.value_or(core::kDefaultCpuDemand);
    const int64_t bandwidth = job.mem_bw.value_or(core::kDefaultMemBwDemand);
    core::ComputeDevice* best = nullptr;
    for (auto* node : devices_.compute) {
        if (node->under_maintenance() || !node->fits(job) || node->cpu_units().level() < cpu ||
            node->mem_bw().level() < bandwidth) {
            continue;
        }
        if (best == nullptr) {
            best = node;
            continue;
        }
        auto key = std::pair{node->cpu_units().level(), node->mem_bw().level()};
        auto best_key = std::pair{best->cpu_units().level(), best->mem_bw().level()};
        if (key > best_key) {
            best = node;
        }
    }
    return best;
}

core::Device* CapacityAwareScheduler::select_device(const core::Job& job) {
    if (is_qpu_phase(job.phase)) {
        return select_qpu(job);
    }
    return select_cpu(job);
}

void CapacityAwareScheduler::run(core::Job& job, Completion on_done) {
    if (job.iterations == 0) {
        throw core::InvalidStateError("Job " + std::to_string(job.id) + " has zero iterations");
    }
    job.iteration = 0;
    job.phase = core::JobPhase::SelectQpu;
    select_phase(std::make_shared<Run>(Run{&job, std::move(on_done)}));
}

void CapacityAwareScheduler::select_phase(const std::shared_ptr<Run>& run) {
    core::Job& job = *run->job;

    if (job.phase == core::JobPhase::SelectQpu && bulk_ != nullptr && needs_bulk(job)) {
        start_phase(run, nullptr);
        return;
    }

    core::Device* device = select_device(job);
    if (device == nullptr) {
        engine_.timeout(core::duration_from_units(kPollInterval), [this, run] { select_phase(run); });
        return;
    }
    start_phase(run, device);
}

void CapacityAwareScheduler::start_phase(const std::shared_ptr<Run>& run, core::Device* device) {
    core::Job& job = *run->job;
    job.phase = job.phase == core::JobPhase::SelectQpu ? core::JobPhase::QpuRun
                                                       : core::JobPhase::CpuRun;
    engine_.trace([&](core::TraceWriter& w) {
        w.type("phase_start");
        w.field("job_id", static_cast<uint64_t>(job.id));
        w.field("phase", core::to_string(job.phase));
        w.field("iteration", static_cast<uint64_t>(job.iteration));
        w.field("device", device != nullptr ? std::string_view(device->name())
                                            : std::string_view("bulk"));
    });

    if (device == nullptr) {
        bulk_->allocate(job, [this, run] { phase_finished(run); });
    } else {
        device->process_job(job, [this, run] { phase_finished(run); });
    }
}

void CapacityAwareScheduler::phase_finished(const std::shared_ptr<Run>& run) {
    core::Job& job = *run->job;
    const bool qpu = job.phase == core::JobPhase::QpuRun;
    engine_.trace([&](core::TraceWriter& w) {
        w.type("phase_finish");
        w.field("job_id", static_cast<uint64_t>(job.id));
        w.field("phase", core::to_string(job.phase));
        w.field("iteration", static_cast<uint64_t>(job.iteration));
    });
    record_phase_metrics(engine_, ledger_, job.id, qpu ? "qpu" : "cpu", job.iteration);

    if (qpu) {
        job.phase = core::JobPhase::SelectCpu;
        select_phase(run);
        return;
    }

    ++job.iteration;
    if (job.iteration < job.iterations) {
        job.phase = core::JobPhase::SelectQpu;
        select_phase(run);
        return;
    }

    record_makespan(engine_, ledger_, job.id);
    job.phase = core::JobPhase::Done;
    Completion done = std::move(run->done);
    done();
}

} // namespace qcloudsim::algo
