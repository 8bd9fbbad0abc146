#include <qcloudsim/core/compute_device.hpp>
#include <qcloudsim/core/engine.hpp>
#include <qcloudsim/core/event_bus.hpp>
#include <qcloudsim/core/job.hpp>
#include <qcloudsim/core/job_ledger.hpp>

#include <algorithm>
#include <random>
#include <utility>

namespace qcloudsim::core {

ComputeDevice::ComputeDevice(DeviceContext context, std::string name, int64_t cpu_capacity,
                             int64_t mem_bw_capacity)
    : Device(context, std::move(name))
    , cpu_units_(context.engine, name_ + ".cpu", cpu_capacity)
    , mem_bw_(context.engine, name_ + ".mem_bw", mem_bw_capacity) {}

bool ComputeDevice::fits(const Job& job) const noexcept {
    const int64_t cpu = std::max(job.cpu_units.value_or(kDefaultCpuDemand), kMaxCpuDraw);
    const int64_t bandwidth = job.mem_bw.value_or(kDefaultMemBwDemand);
    return cpu_units_.capacity() >= cpu && mem_bw_.capacity() >= bandwidth;
}

void ComputeDevice::drop_waiters() {
    Device::drop_waiters();
    cpu_units_.drop_waiters();
    mem_bw_.drop_waiters();
}

void ComputeDevice::process_job(Job& job, Completion on_done) {
    std::uniform_real_distribution<double> service(kMinServiceTime, kMaxServiceTime);
    std::uniform_int_distribution<int64_t> units(kMinCpuDraw, kMaxCpuDraw);
    Duration service_time = duration_from_units(service(ctx_.rng));
    int64_t cpu = units(ctx_.rng);
    int64_t bandwidth = job.mem_bw.value_or(kDefaultMemBwDemand);

    ctx_.ledger.log(job.id, "devc_name", name_);
    ctx_.ledger.log_time(job.id, "cpu_arrive", ctx_.engine.time());
    ctx_.ledger.log(job.id, "cpu_units", static_cast<double>(cpu));
    ctx_.ledger.log(job.id, "cpu_mem_bw", static_cast<double>(bandwidth));

    auto run = std::make_shared<Run>(Run{&job, cpu, bandwidth, service_time, std::move(on_done)});
    cpu_units_.acquire(cpu, [this, run] { acquire_bandwidth(run); });
}

void ComputeDevice::acquire_bandwidth(const std::shared_ptr<Run>& run) {
    try {
        mem_bw_.acquire(run->bandwidth, [this, run] { start(run); });
    } catch (...) {
        cpu_units_.release(run->units);
        throw;
    }
}

void ComputeDevice::start(const std::shared_ptr<Run>& run) {
    ctx_.ledger.log_time(run->job->id, "cpu_start", ctx_.engine.time());
    notify(device_events::start, *run->job);
    ctx_.engine.timeout(run->service, [this, run] { finish(run); });
}

void ComputeDevice::finish(const std::shared_ptr<Run>& run) {
    ctx_.ledger.log_time(run->job->id, "cpu_finish", ctx_.engine.time());
    notify(device_events::finish, *run->job);
    cpu_units_.release(run->units);
    mem_bw_.release(run->bandwidth);

    Completion done = std::move(run->done);
    done();
}

} // namespace qcloudsim::core
